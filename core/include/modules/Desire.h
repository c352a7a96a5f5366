#ifndef DESIRE_H
#define DESIRE_H

#include <random>
#include <vector>

struct Agent;
class Network;
class PrestigeWeights;

/**
 * Mimetic desire: every alive agent with at least one alive neighbor moves
 * its desire vector toward the prestige-weighted mean of its neighbors',
 *
 *   d_i' = max(0, alpha * d_i + (1 - alpha) * pull_i + noise)
 *
 * New vectors are computed from the old state only and committed together.
 * Isolated agents keep their desire and draw no noise.
 */
class DesireModule {
public:
    void update(std::vector<Agent>& agents, const Network& network, const PrestigeWeights& prestige,
                double alpha, double noiseScale, std::mt19937_64& rng);

private:
    std::vector<std::vector<double>> next_;
    std::vector<bool> changed_;
};

#endif
