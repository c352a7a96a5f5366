#include "modules/Status.h"
#include "kernel/Kernel.h"
#include <algorithm>

void StatusModule::update(std::vector<Agent>& agents, const ReceivedAggression& received,
                          double lossRate, double eps) const {
    if (received.ids.empty()) return;

    const double r_max = *std::max_element(received.amounts.begin(), received.amounts.end());
    const double denom = std::max(r_max, eps);

    for (std::size_t t = 0; t < received.ids.size(); ++t) {
        Agent& agent = agents[received.ids[t]];
        agent.status = std::clamp(agent.status - lossRate * received.amounts[t] / denom, 0.0, 1.0);
    }
}
