#ifndef AGENT_H
#define AGENT_H

#include <cstdint>
#include <vector>

// ---------- Agent Structure ----------
struct Agent {
    // Identity
    std::uint32_t id = 0;
    bool alive = true;          // monotonic: never set back to true

    // Mimetic state
    std::vector<double> desire;      // one entry per object, >= 0
    std::vector<double> aggression;  // one entry per agent id (self and dead kept at 0)

    // Status rivalry only; stays in [0,1]
    double status = 0.0;
};

// Zero the entries of an aggression row that point at `self` or at a dead
// agent. Every phase that produces a full aggression row finishes with this.
inline void maskInactiveTargets(std::vector<double>& row, std::uint32_t self,
                                const std::vector<Agent>& agents) {
    if (self < row.size()) row[self] = 0.0;
    const std::size_t n = row.size() < agents.size() ? row.size() : agents.size();
    for (std::size_t j = 0; j < n; ++j) {
        if (!agents[j].alive) row[j] = 0.0;
    }
}

#endif
