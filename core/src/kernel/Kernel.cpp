#include "kernel/Kernel.h"
#include "utils/Validation.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

// ---------- Mode selectors ----------

SourceMode parseSourceMode(const std::string& name) {
    if (name == "object") return SourceMode::Object;
    if (name == "status") return SourceMode::Status;
    throw std::invalid_argument("Invalid source mode: '" + name + "' (expected object|status)");
}

SpreadMode parseSpreadMode(const std::string& name) {
    if (name == "linear") return SpreadMode::Linear;
    if (name == "attention") return SpreadMode::Attention;
    if (name == "threshold") return SpreadMode::Threshold;
    throw std::invalid_argument("Invalid spread mode: '" + name +
                                "' (expected linear|attention|threshold)");
}

const char* toString(SourceMode mode) {
    switch (mode) {
        case SourceMode::Object: return "object";
        case SourceMode::Status: return "status";
    }
    return "unknown";
}

const char* toString(SpreadMode mode) {
    switch (mode) {
        case SpreadMode::Linear: return "linear";
        case SpreadMode::Attention: return "attention";
        case SpreadMode::Threshold: return "threshold";
    }
    return "unknown";
}

void applyVariant(KernelConfig& cfg, const std::string& variant) {
    if (variant == "LM") {
        cfg.source = SourceMode::Object;
        cfg.spread = SpreadMode::Linear;
    } else if (variant == "AC") {
        cfg.source = SourceMode::Object;
        cfg.spread = SpreadMode::Attention;
    } else if (variant == "RL") {
        cfg.source = SourceMode::Status;
        cfg.spread = SpreadMode::Linear;
    } else if (variant == "RA") {
        cfg.source = SourceMode::Status;
        cfg.spread = SpreadMode::Attention;
    } else {
        throw std::invalid_argument("Unknown variant '" + variant + "' (expected AC|LM|RA|RL)");
    }
}

// ---------- Construction ----------

Kernel::Kernel(const KernelConfig& cfg) : cfg_(cfg), rng_(cfg.seed) {
    reset(cfg);
}

Kernel::Kernel(const KernelConfig& cfg, Network network) : cfg_(cfg), rng_(cfg.seed) {
    network.finalize();
    supplied_network_ = std::move(network);
    reset(cfg);
}

void Kernel::reset(const KernelConfig& cfg) {
    validateConfig(cfg);
    if (supplied_network_ && supplied_network_->size() != cfg.population) {
        throw std::invalid_argument("network has " + std::to_string(supplied_network_->size()) +
                                    " nodes but population is " + std::to_string(cfg.population));
    }
    cfg_ = cfg;

    // A supplied topology is kept for the lifetime of the kernel
    if (supplied_network_) {
        initialize(*supplied_network_);
        return;
    }
    std::mt19937_64 topologyRng(cfg_.seed ^ TuningConstants::kNetworkSeedMix);
    initialize(Network::wattsStrogatz(cfg_.population, cfg_.avgConnections, cfg_.rewireProb, topologyRng));
}

void Kernel::validateConfig(const KernelConfig& cfg) const {
    auto fail = [](const std::string& field, double value) {
        throw std::invalid_argument(field + " out of range (got " + std::to_string(value) + ")");
    };

    if (cfg.population == 0) fail("population", cfg.population);
    if (cfg.objects == 0) fail("objects", cfg.objects);
    if (cfg.rivalrousObjects > cfg.objects) fail("rivalrousObjects", cfg.rivalrousObjects);
    if (cfg.rewireProb < 0.0 || cfg.rewireProb > 1.0) fail("rewireProb", cfg.rewireProb);
    if (cfg.alpha < 0.0 || cfg.alpha > 1.0) fail("alpha", cfg.alpha);
    if (cfg.aggressionDecay < 0.0 || cfg.aggressionDecay > 1.0) fail("aggressionDecay", cfg.aggressionDecay);
    if (cfg.desireInitMax < 0.0) fail("desireInitMax", cfg.desireInitMax);
    if (cfg.desireNoise < 0.0) fail("desireNoise", cfg.desireNoise);
    if (cfg.salienceExponent < 0.0) fail("salienceExponent", cfg.salienceExponent);
    if (cfg.rivalryToAggression < 0.0) fail("rivalryToAggression", cfg.rivalryToAggression);
    if (cfg.rivalryIntensity < 0.0) fail("rivalryIntensity", cfg.rivalryIntensity);
    if (cfg.sigmaStatus <= 0.0) fail("sigmaStatus", cfg.sigmaStatus);
    if (cfg.cStatus < 0.0) fail("cStatus", cfg.cStatus);
    if (cfg.statusInitLow < 0.0 || cfg.statusInitLow > 1.0) fail("statusInitLow", cfg.statusInitLow);
    if (cfg.statusInitHigh < cfg.statusInitLow || cfg.statusInitHigh > 1.0) {
        fail("statusInitHigh", cfg.statusInitHigh);
    }
    if (cfg.statusLossRate < 0.0) fail("statusLossRate", cfg.statusLossRate);
    if (cfg.eps <= 0.0) fail("eps", cfg.eps);
    if (cfg.thresholdFraction < 0.0) fail("thresholdFraction", cfg.thresholdFraction);
    if (cfg.steps < 0) fail("steps", cfg.steps);
    if (cfg.source != SourceMode::Object && cfg.source != SourceMode::Status) {
        fail("source", static_cast<int>(cfg.source));
    }
    if (cfg.spread != SpreadMode::Linear && cfg.spread != SpreadMode::Attention &&
        cfg.spread != SpreadMode::Threshold) {
        fail("spread", static_cast<int>(cfg.spread));
    }
}

void Kernel::initialize(Network network) {
    // Strategies first, so a bad mode leaves the kernel untouched
    auto source = AggressionSource::create(cfg_.source);
    auto spread = AggressionSpread::create(cfg_.spread);

    generation_ = 0;
    rng_.seed(cfg_.seed);
    history_.clear();
    event_log_.clear();

    network_ = std::move(network);

    // Random stream order: prestige baseline, desires, status, spread setup
    prestige_.initialize(network_, rng_);
    initAgents();

    source_ = std::move(source);
    spread_ = std::move(spread);
    spread_->initialize(agents_.size(), cfg_, rng_);

    prestige_.refresh(agents_, statusMode(), cfg_.cStatus);
}

void Kernel::initAgents() {
    agents_.clear();
    agents_.reserve(cfg_.population);

    std::uniform_real_distribution<double> desireDist(0.0, cfg_.desireInitMax);

    for (std::uint32_t i = 0; i < cfg_.population; ++i) {
        Agent a;
        a.id = i;
        a.alive = true;
        a.desire.resize(cfg_.objects);
        for (auto& d : a.desire) {
            d = desireDist(rng_);
        }
        a.aggression.assign(cfg_.population, 0.0);
        agents_.push_back(std::move(a));
    }

    if (statusMode()) {
        std::uniform_real_distribution<double> statusDist(cfg_.statusInitLow, cfg_.statusInitHigh);
        for (auto& a : agents_) {
            a.status = statusDist(rng_);
        }
    }
}

// ---------- Phases ----------

void Kernel::refreshPrestige() {
    prestige_.refresh(agents_, statusMode(), cfg_.cStatus);
}

void Kernel::updateDesire() {
    desire_.update(agents_, network_, prestige_, cfg_.alpha, cfg_.desireNoise, rng_);
}

void Kernel::sourceAggression() {
    source_->apply(agents_, network_, cfg_);
}

void Kernel::spreadAggression() {
    spread_->apply(agents_, network_, prestige_, cfg_);
}

void Kernel::decayAggression() {
    const double factor = 1.0 - cfg_.aggressionDecay;
    for (auto& agent : agents_) {
        if (!agent.alive) continue;
        for (auto& a : agent.aggression) {
            a *= factor;
        }
    }
}

std::optional<ExpulsionOutcome> Kernel::checkExpulsion() {
    return expulsion_.apply(agents_, cfg_.expulsionThreshold, generation_, event_log_);
}

void Kernel::updateStatus() {
    if (!statusMode()) return;
    status_.update(agents_, computeReceivedAggression(agents_), cfg_.statusLossRate, cfg_.eps);
}

void Kernel::recordMetrics() {
    history_.append(computeMetrics());
}

void Kernel::finishStep() {
    if (cfg_.recordHistory) {
        recordMetrics();
    }
    checkInvariants();
    ++generation_;
}

void Kernel::step() {
    // Prestige depends on status and feeds both desire and spread
    refreshPrestige();
    updateDesire();
    sourceAggression();
    refreshPrestige();
    spreadAggression();
    decayAggression();
    checkExpulsion();
    updateStatus();
    finishStep();
}

void Kernel::stepN(int n) {
    for (int i = 0; i < n; ++i) {
        step();
    }
}

void Kernel::run() {
    stepN(cfg_.steps);
}

// ---------- Queries ----------

std::uint32_t Kernel::aliveCount() const {
    return static_cast<std::uint32_t>(
        std::count_if(agents_.begin(), agents_.end(), [](const Agent& a) { return a.alive; }));
}

ReceivedAggression Kernel::receivedAggression() const {
    return computeReceivedAggression(agents_);
}

StepMetrics Kernel::computeMetrics() const {
    return computeStepMetrics(agents_, TuningConstants::kModalEligibilityEps);
}

ModalAgreement Kernel::modalAgreement() const {
    return computeModalAgreement(agents_, TuningConstants::kModalEligibilityEps);
}

void Kernel::checkInvariants() const {
#ifndef NDEBUG
    for (const auto& agent : agents_) {
        for (double d : agent.desire) {
            validation::checkNonNegative(d, "desire");
        }
        if (statusMode()) {
            validation::checkUnitInterval(agent.status, "status");
        }
        if (!agent.alive) {
            for (double a : agent.aggression) {
                validation::checkZero(a, "aggression row of expelled agent");
            }
            continue;
        }
        validation::checkZero(agent.aggression[agent.id], "self aggression");
        for (const auto& target : agents_) {
            if (!target.alive) {
                validation::checkZero(agent.aggression[target.id], "aggression toward expelled agent");
            }
        }
    }
#endif
}

std::vector<Kernel> runMany(const KernelConfig& cfg, int runs) {
    std::vector<Kernel> kernels;
    kernels.reserve(runs > 0 ? static_cast<std::size_t>(runs) : 0);
    for (int r = 0; r < runs; ++r) {
        KernelConfig runCfg = cfg;
        runCfg.seed = cfg.seed + static_cast<std::uint64_t>(r) * 1000;
        kernels.emplace_back(runCfg);
        kernels.back().run();
    }
    return kernels;
}
