#ifndef AGGRESSION_SOURCE_H
#define AGGRESSION_SOURCE_H

#include <memory>
#include <vector>

struct Agent;
struct KernelConfig;
class Network;
enum class SourceMode;

/**
 * Converts rivalry into aggression increments on alive directed edges.
 *
 * Increments are added to the existing aggression; nothing is normalized
 * here. The concrete rivalry rule is fixed for the lifetime of a run.
 */
class AggressionSource {
public:
    virtual ~AggressionSource() = default;

    void apply(std::vector<Agent>& agents, const Network& network, const KernelConfig& cfg) const;

    virtual SourceMode mode() const = 0;

    static std::unique_ptr<AggressionSource> create(SourceMode mode);

protected:
    // Aggression added to agents[i].aggression[k] for the alive edge (i, k)
    virtual double increment(const Agent& subject, const Agent& rival, const Network& network,
                             const KernelConfig& cfg) const = 0;
};

// Shared desire over the rivalrous objects, attenuated by social distance:
//   rivalryToAggression * (1 - alpha) * sum_o min(d_i[o], d_k[o]) / max(1, dist(i,k))
class ObjectRivalrySource final : public AggressionSource {
public:
    SourceMode mode() const override;

protected:
    double increment(const Agent& subject, const Agent& rival, const Network& network,
                     const KernelConfig& cfg) const override;
};

// Status proximity with an upward bias:
//   rivalryIntensity * (1 - alpha) * (1 + betaUp * max(0, S_k - S_i)) * exp(-|S_i - S_k| / sigmaStatus)
class StatusRivalrySource final : public AggressionSource {
public:
    SourceMode mode() const override;

protected:
    double increment(const Agent& subject, const Agent& rival, const Network& network,
                     const KernelConfig& cfg) const override;
};

#endif
