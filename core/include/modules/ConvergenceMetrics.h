#ifndef CONVERGENCE_METRICS_H
#define CONVERGENCE_METRICS_H

#include <cstddef>
#include <cstdint>
#include <vector>

struct Agent;

// Total aggression each alive agent receives from the other alive agents.
// ids and amounts are aligned and sorted by id.
struct ReceivedAggression {
    std::vector<std::uint32_t> ids;
    std::vector<double> amounts;

    double total() const;
    bool contains(std::uint32_t id) const;
};

ReceivedAggression computeReceivedAggression(const std::vector<Agent>& agents);

// ---------- Distribution statistics ----------
// All return 0 for empty or all-zero input.

// Rank-weighted Gini over nonnegative values
double gini(std::vector<double> values);
// Shannon entropy (bits) of values / sum(values)
double entropy(const std::vector<double>& values);
// max / sum
double maxShare(const std::vector<double>& values);
// Share of the k largest values in the sum
double topShare(const std::vector<double>& values, std::size_t k);
// top1 / top2; top1 itself when top2 is 0; 0 with fewer than two values
double convergenceRatio(const std::vector<double>& values);

struct ModalAgreement {
    double agreement = 0.0;      // fraction of eligible agents sharing the modal target
    std::uint32_t eligible = 0;  // agents whose outgoing aggression exceeds the epsilon
    std::int64_t target = -1;    // modal target id, -1 when nobody is eligible
};

ModalAgreement computeModalAgreement(const std::vector<Agent>& agents, double epsilon);

// Herfindahl index of the desire mass summed over alive agents
double desireConcentration(const std::vector<Agent>& agents);

// First index from which `series` stays >= level for `consecutive` entries;
// series.size() when that never happens.
std::size_t timeToThreshold(const std::vector<double>& series, double level, std::size_t consecutive);

// ---------- Per-step record ----------

struct StepMetrics {
    double tension = 0.0;             // sum of received aggression
    double gini = 0.0;
    double entropy = 0.0;
    double maxShare = 0.0;
    double convergenceRatio = 0.0;
    double modalAgreement = 0.0;
    std::uint32_t eligibleAgents = 0;
    std::uint32_t activeAgents = 0;
    double meanAggression = 0.0;      // mean received aggression
    double topTargetAggression = 0.0; // max received aggression
    double top3Share = 0.0;
    double meanDesire = 0.0;
    double desireConcentration = 0.0;
};

StepMetrics computeStepMetrics(const std::vector<Agent>& agents, double modalEpsilon);

// Append-only named series, one entry per recorded step
struct MetricsHistory {
    std::vector<double> tension;
    std::vector<double> gini;
    std::vector<double> entropy;
    std::vector<double> maxShare;
    std::vector<double> convergenceRatio;
    std::vector<double> modalAgreement;
    std::vector<std::uint32_t> eligibleAgents;
    std::vector<std::uint32_t> activeAgents;
    std::vector<double> meanAggression;
    std::vector<double> topTargetAggression;
    std::vector<double> top3Share;
    std::vector<double> meanDesire;
    std::vector<double> desireConcentration;

    void append(const StepMetrics& m);
    void clear();
    std::size_t size() const { return tension.size(); }
    bool empty() const { return tension.empty(); }
};

#endif
