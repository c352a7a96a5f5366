#include "modules/Desire.h"
#include "kernel/Kernel.h"
#include "utils/Validation.h"
#include <algorithm>

void DesireModule::update(std::vector<Agent>& agents, const Network& network, const PrestigeWeights& prestige,
                          double alpha, double noiseScale, std::mt19937_64& rng) {
    const std::size_t n = agents.size();
    next_.resize(n);
    changed_.assign(n, false);

    // Noise is drawn in id order from the run's stream, so this pass stays serial
    std::normal_distribution<double> noiseDist(0.0, noiseScale > 0.0 ? noiseScale : 1.0);

    for (std::size_t i = 0; i < n; ++i) {
        const Agent& agent = agents[i];
        if (!agent.alive) continue;

        const std::size_t objects = agent.desire.size();
        auto& pull = next_[i];
        pull.assign(objects, 0.0);

        const auto& nbrs = network.neighbors(agent.id);
        double total_weight = 0.0;
        int alive_neighbors = 0;
        for (std::size_t s = 0; s < nbrs.size(); ++s) {
            const Agent& model = agents[nbrs[s]];
            if (!model.alive) continue;
            ++alive_neighbors;
            const double w = prestige.weightAt(agent.id, s);
            for (std::size_t o = 0; o < objects; ++o) {
                pull[o] += w * model.desire[o];
            }
            total_weight += w;
        }

        // Isolated: desire unchanged, no noise drawn
        if (alive_neighbors == 0) continue;

        if (total_weight > 0.0) {
            const double inv_w = 1.0 / total_weight;
            for (auto& p : pull) p *= inv_w;
        } else {
            std::fill(pull.begin(), pull.end(), 0.0);
        }

        for (std::size_t o = 0; o < objects; ++o) {
            double d = alpha * agent.desire[o] + (1.0 - alpha) * pull[o];
            if (noiseScale > 0.0) {
                d += noiseDist(rng);
            }
            pull[o] = std::max(0.0, d);
        }
        changed_[i] = true;
    }

    // Commit
    for (std::size_t i = 0; i < n; ++i) {
        if (!changed_[i]) continue;
        agents[i].desire.swap(next_[i]);
        for (double d : agents[i].desire) {
            validation::checkNonNegative(d, "desire");
        }
    }
}
