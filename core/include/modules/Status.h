#ifndef STATUS_H
#define STATUS_H

#include <vector>

struct Agent;
struct ReceivedAggression;

// Status loss of targeted survivors (status rivalry only):
//   S_k <- clamp(S_k - lossRate * r_k / max(r_max, eps), 0, 1)
class StatusModule {
public:
    void update(std::vector<Agent>& agents, const ReceivedAggression& received,
                double lossRate, double eps) const;
};

#endif
