#include "modules/Expulsion.h"
#include "kernel/Kernel.h"
#include <algorithm>

std::optional<ExpulsionOutcome> ExpulsionModule::apply(std::vector<Agent>& agents,
                                                       std::optional<double> threshold,
                                                       std::uint64_t step, EventLog& log) const {
    if (!threshold) return std::nullopt;

    const ReceivedAggression before = computeReceivedAggression(agents);
    if (before.ids.empty()) return std::nullopt;

    // Strict comparison keeps the lowest id on exact ties (ids are sorted)
    std::size_t top = 0;
    for (std::size_t t = 1; t < before.amounts.size(); ++t) {
        if (before.amounts[t] > before.amounts[top]) top = t;
    }
    if (before.amounts[top] < *threshold) return std::nullopt;

    ExpulsionOutcome outcome;
    outcome.victim = before.ids[top];
    outcome.received = before.amounts[top];

    Agent& victim = agents[outcome.victim];
    victim.alive = false;
    std::fill(victim.aggression.begin(), victim.aggression.end(), 0.0);
    for (auto& other : agents) {
        if (other.alive) other.aggression[outcome.victim] = 0.0;
    }
    log.recordExpulsion(step, outcome.victim, outcome.received);

    const double pre = before.total();
    const double post = pre > 0.0 ? computeReceivedAggression(agents).total() : 0.0;
    outcome.catharsis = catharsis(pre, post);
    log.recordCatharsis(step, outcome.victim, outcome.catharsis);

    return outcome;
}

double ExpulsionModule::catharsis(double preTension, double postTension) {
    if (preTension <= 0.0) return 0.0;
    return std::max(0.0, (preTension - postTension) / preTension);
}
