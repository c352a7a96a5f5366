#ifndef EXPULSION_H
#define EXPULSION_H

#include <cstdint>
#include <optional>
#include <vector>

struct Agent;
class EventLog;

struct ExpulsionOutcome {
    std::uint32_t victim = 0;
    double received = 0.0;
    double catharsis = 0.0;
};

/**
 * Removes the most-targeted agent once its received aggression reaches the
 * threshold. At most one agent is expelled per call.
 *
 * Ties on the maximum go to the lowest id. The victim's own row is zeroed
 * and every survivor's aggression toward it is cleared; the agent stays in
 * the vector with alive = false.
 */
class ExpulsionModule {
public:
    std::optional<ExpulsionOutcome> apply(std::vector<Agent>& agents, std::optional<double> threshold,
                                          std::uint64_t step, EventLog& log) const;

    // (pre - post) / pre clamped at 0; 0 when pre <= 0
    static double catharsis(double preTension, double postTension);
};

#endif
