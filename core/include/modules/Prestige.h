#ifndef PRESTIGE_H
#define PRESTIGE_H

#include <cstdint>
#include <random>
#include <vector>

struct Agent;
class Network;

/**
 * Directed imitation weights w(subject, model) on the edges of the network.
 *
 * Stored adjacency-indexed: weights_[i][s] belongs to the edge from agent i
 * to its s-th neighbor, so hot loops walk a neighbor list and its weights
 * side by side. A pair without an edge has weight 0.
 *
 * Object rivalry keeps the baseline weights. Status rivalry rescales them
 * every refresh by the model's current status: w = w0 * (cStatus + S_model).
 */
class PrestigeWeights {
public:
    // Draws a baseline weight for both directions of every edge
    void initialize(const Network& network, std::mt19937_64& rng);

    void refresh(const std::vector<Agent>& agents, bool statusWeighted, double cStatus);

    double weight(std::uint32_t subject, std::uint32_t model) const;
    double weightAt(std::uint32_t subject, std::size_t slot) const { return weights_[subject][slot]; }
    double baselineAt(std::uint32_t subject, std::size_t slot) const { return baseline_[subject][slot]; }

    std::size_t size() const { return models_.size(); }

private:
    std::vector<std::vector<std::uint32_t>> models_;  // mirrors the network adjacency
    std::vector<std::vector<double>> baseline_;
    std::vector<std::vector<double>> weights_;
};

#endif
