#include "modules/AggressionSpread.h"
#include "kernel/Kernel.h"
#include "utils/Validation.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

std::unique_ptr<AggressionSpread> AggressionSpread::create(SpreadMode mode) {
    switch (mode) {
        case SpreadMode::Linear: return std::make_unique<LinearSpread>();
        case SpreadMode::Attention: return std::make_unique<AttentionSpread>();
        case SpreadMode::Threshold: return std::make_unique<ThresholdSpread>();
    }
    throw std::invalid_argument("Invalid spread mode");
}

void AggressionSpread::initialize(std::size_t /*population*/, const KernelConfig& /*cfg*/,
                                  std::mt19937_64& /*rng*/) {}

void AggressionSpread::apply(std::vector<Agent>& agents, const Network& network, const PrestigeWeights& prestige,
                             const KernelConfig& cfg) {
    const std::size_t n = agents.size();
    next_.resize(n);
    hasNext_.assign(n, 0);

    // Rows depend only on the old state and are written to separate buffers
    #pragma omp parallel for schedule(static)
    for (std::size_t i = 0; i < n; ++i) {
        const Agent& agent = agents[i];
        if (!agent.alive) continue;

        const auto& nbrs = network.neighbors(agent.id);
        std::vector<AliveNeighbor> alive_neighbors;
        alive_neighbors.reserve(nbrs.size());
        for (std::size_t s = 0; s < nbrs.size(); ++s) {
            if (agents[nbrs[s]].alive) {
                alive_neighbors.push_back({nbrs[s], static_cast<std::uint32_t>(s)});
            }
        }
        if (alive_neighbors.empty()) continue;  // keeps its row

        auto& out = next_[i];
        out.assign(agent.aggression.size(), 0.0);
        spreadRow(agent.id, agents, alive_neighbors, prestige, cfg, out);
        maskInactiveTargets(out, agent.id, agents);
        hasNext_[i] = 1;
    }

    // Commit all rows at once
    for (std::size_t i = 0; i < n; ++i) {
        if (!hasNext_[i]) continue;
        agents[i].aggression.swap(next_[i]);
        for (double a : agents[i].aggression) {
            validation::checkFinite(a, "aggression");
        }
    }
}

void AggressionSpread::neighborHostility(std::uint32_t i, const std::vector<Agent>& agents,
                                         const std::vector<AliveNeighbor>& aliveNeighbors,
                                         const PrestigeWeights& prestige, std::vector<double>& out) {
    out.assign(agents[i].aggression.size(), 0.0);
    double total_weight = 0.0;
    for (const auto& nbr : aliveNeighbors) {
        const double w = prestige.weightAt(i, nbr.slot);
        const auto& row = agents[nbr.id].aggression;
        for (std::size_t j = 0; j < out.size(); ++j) {
            out[j] += w * row[j];
        }
        total_weight += w;
    }

    if (total_weight > 0.0) {
        const double inv_w = 1.0 / total_weight;
        for (auto& h : out) h *= inv_w;
    } else {
        std::fill(out.begin(), out.end(), 0.0);
    }
    maskInactiveTargets(out, i, agents);
}

// ---------- Linear ----------

SpreadMode LinearSpread::mode() const {
    return SpreadMode::Linear;
}

void LinearSpread::spreadRow(std::uint32_t i, const std::vector<Agent>& agents,
                             const std::vector<AliveNeighbor>& aliveNeighbors,
                             const PrestigeWeights& prestige, const KernelConfig& cfg,
                             std::vector<double>& out) const {
    std::vector<double> hostility;
    neighborHostility(i, agents, aliveNeighbors, prestige, hostility);

    const auto& own = agents[i].aggression;
    for (std::size_t j = 0; j < out.size(); ++j) {
        out[j] = cfg.alpha * own[j] + (1.0 - cfg.alpha) * hostility[j];
    }
}

// ---------- Attention ----------

SpreadMode AttentionSpread::mode() const {
    return SpreadMode::Attention;
}

void AttentionSpread::spreadRow(std::uint32_t i, const std::vector<Agent>& agents,
                                const std::vector<AliveNeighbor>& aliveNeighbors,
                                const PrestigeWeights& prestige, const KernelConfig& cfg,
                                std::vector<double>& out) const {
    std::vector<double> hostility;
    neighborHostility(i, agents, aliveNeighbors, prestige, hostility);

    std::vector<double> pull;
    attentionPull(hostility, cfg.salienceExponent, pull);

    // Zero perceived mass leaves only the autonomy term; pull is all zeros then
    const auto& own = agents[i].aggression;
    for (std::size_t j = 0; j < out.size(); ++j) {
        out[j] = cfg.alpha * own[j] + (1.0 - cfg.alpha) * pull[j];
    }
}

void attentionPull(const std::vector<double>& hostility, double gamma, std::vector<double>& out) {
    out.assign(hostility.size(), 0.0);

    const double total = std::accumulate(hostility.begin(), hostility.end(), 0.0);
    if (!(total > 0.0)) return;

    // Scale by the peak before sharpening: same weights, no overflow, and
    // the peak entry contributes exactly 1 so the normalizer is never 0
    const double peak = *std::max_element(hostility.begin(), hostility.end());
    double sharp_total = 0.0;
    for (std::size_t j = 0; j < hostility.size(); ++j) {
        if (hostility[j] > 0.0) {
            out[j] = std::pow(hostility[j] / peak, gamma);
            sharp_total += out[j];
        }
    }

    const double scale = total / sharp_total;
    for (auto& v : out) v *= scale;
}

std::vector<double> attentionPull(const std::vector<double>& hostility, double gamma) {
    std::vector<double> out;
    attentionPull(hostility, gamma, out);
    return out;
}

// ---------- Threshold contagion ----------

SpreadMode ThresholdSpread::mode() const {
    return SpreadMode::Threshold;
}

void ThresholdSpread::initialize(std::size_t population, const KernelConfig& cfg, std::mt19937_64& rng) {
    std::uniform_real_distribution<double> thresholdDist(
        cfg.thresholdFraction * TuningConstants::kThresholdSpreadLow,
        cfg.thresholdFraction * TuningConstants::kThresholdSpreadHigh);
    thresholds_.resize(population);
    for (auto& t : thresholds_) {
        t = thresholdDist(rng);
    }
}

namespace {
double median(std::vector<double>& values) {
    const std::size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    const double upper = values[mid];
    if (values.size() % 2) return upper;
    const double lower = *std::max_element(values.begin(), values.begin() + mid);
    return 0.5 * (lower + upper);
}
}

void ThresholdSpread::spreadRow(std::uint32_t i, const std::vector<Agent>& agents,
                                const std::vector<AliveNeighbor>& aliveNeighbors,
                                const PrestigeWeights& /*prestige*/, const KernelConfig& cfg,
                                std::vector<double>& out) const {
    out = agents[i].aggression;
    const double threshold = i < thresholds_.size() ? thresholds_[i] : cfg.thresholdFraction;
    const double neighbor_count = static_cast<double>(aliveNeighbors.size());

    std::vector<double> toward(aliveNeighbors.size());
    for (const auto& target : agents) {
        if (!target.alive || target.id == i) continue;
        const std::uint32_t v = target.id;

        for (std::size_t s = 0; s < aliveNeighbors.size(); ++s) {
            toward[s] = agents[aliveNeighbors[s].id].aggression[v];
        }
        std::vector<double> scratch = toward;
        const double cutoff = median(scratch) + TuningConstants::kHostileMargin;
        const auto hostile = std::count_if(toward.begin(), toward.end(),
                                           [cutoff](double a) { return a > cutoff; });
        const double fraction = static_cast<double>(hostile) / neighbor_count;

        if (fraction >= threshold) {
            out[v] += cfg.thresholdBoost * fraction;
        } else {
            out[v] *= TuningConstants::kSubThresholdRetention;
        }
    }
}
