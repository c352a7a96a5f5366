#include "modules/AggressionSource.h"
#include "kernel/Kernel.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

std::unique_ptr<AggressionSource> AggressionSource::create(SourceMode mode) {
    switch (mode) {
        case SourceMode::Object: return std::make_unique<ObjectRivalrySource>();
        case SourceMode::Status: return std::make_unique<StatusRivalrySource>();
    }
    throw std::invalid_argument("Invalid source mode");
}

void AggressionSource::apply(std::vector<Agent>& agents, const Network& network, const KernelConfig& cfg) const {
    // Increments read desire/status only, so rows can be updated in place
    for (auto& agent : agents) {
        if (!agent.alive) continue;
        for (std::uint32_t k : network.neighbors(agent.id)) {
            const Agent& rival = agents[k];
            if (!rival.alive) continue;
            agent.aggression[k] += increment(agent, rival, network, cfg);
        }
        maskInactiveTargets(agent.aggression, agent.id, agents);
    }
}

// ---------- Object rivalry ----------

SourceMode ObjectRivalrySource::mode() const {
    return SourceMode::Object;
}

double ObjectRivalrySource::increment(const Agent& subject, const Agent& rival, const Network& network,
                                      const KernelConfig& cfg) const {
    const double dist = network.distance(subject.id, rival.id);
    if (std::isinf(dist)) return 0.0;

    double shared = 0.0;
    const std::size_t rivalrous = std::min<std::size_t>(cfg.rivalrousObjects, subject.desire.size());
    for (std::size_t o = 0; o < rivalrous; ++o) {
        shared += std::min(subject.desire[o], rival.desire[o]);
    }
    return cfg.rivalryToAggression * (1.0 - cfg.alpha) * shared / std::max(1.0, dist);
}

// ---------- Status rivalry ----------

SourceMode StatusRivalrySource::mode() const {
    return SourceMode::Status;
}

double StatusRivalrySource::increment(const Agent& subject, const Agent& rival, const Network& /*network*/,
                                      const KernelConfig& cfg) const {
    const double gap = std::abs(subject.status - rival.status);
    const double proximity = std::exp(-gap / cfg.sigmaStatus);
    const double upward = 1.0 + cfg.betaUp * std::max(0.0, rival.status - subject.status);
    return cfg.rivalryIntensity * (1.0 - cfg.alpha) * upward * proximity;
}
