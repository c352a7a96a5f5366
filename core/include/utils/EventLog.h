#ifndef EVENT_LOG_H
#define EVENT_LOG_H

#include <cstdint>
#include <vector>

// An agent removed by collective hostility.
struct ExpulsionEvent {
    std::uint64_t step = 0;
    std::uint32_t victim = 0;
    double received = 0.0;   // received aggression at the moment of expulsion
};

// Fractional drop in system tension caused by one expulsion.
struct CatharsisEvent {
    std::uint64_t step = 0;
    std::uint32_t victim = 0;
    double drop = 0.0;       // in [0, 1]
};

/**
 * Append-only event record for a single simulation run.
 *
 * Events are never rewritten once appended; a reset of the owning kernel
 * clears the whole log.
 */
class EventLog {
public:
    void recordExpulsion(std::uint64_t step, std::uint32_t victim, double received) {
        expulsions_.push_back({step, victim, received});
    }

    void recordCatharsis(std::uint64_t step, std::uint32_t victim, double drop) {
        catharsis_.push_back({step, victim, drop});
    }

    const std::vector<ExpulsionEvent>& expulsions() const { return expulsions_; }
    const std::vector<CatharsisEvent>& catharsis() const { return catharsis_; }

    bool wasExpelled(std::uint32_t id) const {
        for (const auto& e : expulsions_) {
            if (e.victim == id) return true;
        }
        return false;
    }

    bool empty() const { return expulsions_.empty() && catharsis_.empty(); }

    void clear() {
        expulsions_.clear();
        catharsis_.clear();
    }

private:
    std::vector<ExpulsionEvent> expulsions_;
    std::vector<CatharsisEvent> catharsis_;
};

#endif
