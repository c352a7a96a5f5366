#ifndef AGGRESSION_SPREAD_H
#define AGGRESSION_SPREAD_H

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

struct Agent;
struct KernelConfig;
class Network;
class PrestigeWeights;
enum class SpreadMode;

// An alive neighbor and its position in the subject's adjacency list
struct AliveNeighbor {
    std::uint32_t id;
    std::uint32_t slot;
};

/**
 * Mimetic transmission of aggression through the network.
 *
 * apply() computes a new aggression row for every alive agent from the old
 * state of all agents, masks self and dead targets, then commits all rows at
 * once. Agents without an alive neighbor keep their row.
 *
 * Strategies only decide how one row is formed (spreadRow); they must not
 * touch shared state there, so rows can be computed in parallel.
 */
class AggressionSpread {
public:
    virtual ~AggressionSpread() = default;

    // Construction-time setup that may consume the run's random stream
    virtual void initialize(std::size_t population, const KernelConfig& cfg, std::mt19937_64& rng);

    void apply(std::vector<Agent>& agents, const Network& network, const PrestigeWeights& prestige,
               const KernelConfig& cfg);

    virtual SpreadMode mode() const = 0;

    static std::unique_ptr<AggressionSpread> create(SpreadMode mode);

protected:
    virtual void spreadRow(std::uint32_t i, const std::vector<Agent>& agents,
                           const std::vector<AliveNeighbor>& aliveNeighbors,
                           const PrestigeWeights& prestige, const KernelConfig& cfg,
                           std::vector<double>& out) const = 0;

    // Prestige-weighted mean of alive neighbors' aggression rows, with self
    // and dead targets zeroed. All zeros when the total weight is zero.
    static void neighborHostility(std::uint32_t i, const std::vector<Agent>& agents,
                                  const std::vector<AliveNeighbor>& aliveNeighbors,
                                  const PrestigeWeights& prestige, std::vector<double>& out);

private:
    std::vector<std::vector<double>> next_;
    std::vector<std::uint8_t> hasNext_;
};

// result = alpha * a_i + (1 - alpha) * h_i
class LinearSpread final : public AggressionSpread {
public:
    SpreadMode mode() const override;

protected:
    void spreadRow(std::uint32_t i, const std::vector<Agent>& agents,
                   const std::vector<AliveNeighbor>& aliveNeighbors,
                   const PrestigeWeights& prestige, const KernelConfig& cfg,
                   std::vector<double>& out) const override;
};

// result = alpha * a_i + (1 - alpha) * attentionPull(h_i, gamma)
class AttentionSpread final : public AggressionSpread {
public:
    SpreadMode mode() const override;

protected:
    void spreadRow(std::uint32_t i, const std::vector<Agent>& agents,
                   const std::vector<AliveNeighbor>& aliveNeighbors,
                   const PrestigeWeights& prestige, const KernelConfig& cfg,
                   std::vector<double>& out) const override;
};

/**
 * Threshold contagion (Granovetter-style piling on).
 *
 * For each alive target v, a neighbor counts as hostile toward v when its
 * aggression toward v exceeds the neighbors' median by a fixed margin. Once
 * the hostile fraction reaches the agent's personal threshold, the agent
 * adds boost * fraction toward v; below it, aggression toward v fades.
 */
class ThresholdSpread final : public AggressionSpread {
public:
    void initialize(std::size_t population, const KernelConfig& cfg, std::mt19937_64& rng) override;
    SpreadMode mode() const override;

    const std::vector<double>& thresholds() const { return thresholds_; }

protected:
    void spreadRow(std::uint32_t i, const std::vector<Agent>& agents,
                   const std::vector<AliveNeighbor>& aliveNeighbors,
                   const PrestigeWeights& prestige, const KernelConfig& cfg,
                   std::vector<double>& out) const override;

private:
    std::vector<double> thresholds_;
};

// Convex redistribution of perceived hostility.
//
// With H = sum(h) > 0 the result is (h^gamma / sum(h^gamma)) * H: the mass
// H is kept and only concentrated toward the largest entries. Zero entries
// stay zero for every gamma. H == 0 yields the zero vector. gamma == 1
// returns h itself.
void attentionPull(const std::vector<double>& hostility, double gamma, std::vector<double>& out);
std::vector<double> attentionPull(const std::vector<double>& hostility, double gamma);

#endif
