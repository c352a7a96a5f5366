#include "modules/Prestige.h"
#include "kernel/Kernel.h"

void PrestigeWeights::initialize(const Network& network, std::mt19937_64& rng) {
    const std::uint32_t N = network.size();
    models_.assign(N, {});
    baseline_.assign(N, {});
    for (std::uint32_t i = 0; i < N; ++i) {
        models_[i] = network.neighbors(i);
        baseline_[i].assign(models_[i].size(), 0.0);
    }

    // Both directions of an edge are drawn when the edge is first met from
    // its lower endpoint, subject->model first
    std::uniform_real_distribution<double> weightDist(TuningConstants::kPrestigeMin,
                                                      TuningConstants::kPrestigeMax);
    for (std::uint32_t i = 0; i < N; ++i) {
        for (std::size_t s = 0; s < models_[i].size(); ++s) {
            const std::uint32_t j = models_[i][s];
            if (j < i) continue;
            baseline_[i][s] = weightDist(rng);
            const int back = network.slotOf(j, i);
            baseline_[j][static_cast<std::size_t>(back)] = weightDist(rng);
        }
    }

    weights_ = baseline_;
}

void PrestigeWeights::refresh(const std::vector<Agent>& agents, bool statusWeighted, double cStatus) {
    if (!statusWeighted) {
        // Static weights
        return;
    }
    for (std::size_t i = 0; i < models_.size(); ++i) {
        const auto& models = models_[i];
        for (std::size_t s = 0; s < models.size(); ++s) {
            weights_[i][s] = baseline_[i][s] * (cStatus + agents[models[s]].status);
        }
    }
}

double PrestigeWeights::weight(std::uint32_t subject, std::uint32_t model) const {
    if (subject >= models_.size()) return 0.0;
    const auto& models = models_[subject];
    for (std::size_t s = 0; s < models.size(); ++s) {
        if (models[s] == model) return weights_[subject][s];
    }
    return 0.0;
}
