#include "modules/ConvergenceMetrics.h"
#include "kernel/Kernel.h"
#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <numeric>

double ReceivedAggression::total() const {
    return std::accumulate(amounts.begin(), amounts.end(), 0.0);
}

bool ReceivedAggression::contains(std::uint32_t id) const {
    return std::binary_search(ids.begin(), ids.end(), id);
}

ReceivedAggression computeReceivedAggression(const std::vector<Agent>& agents) {
    ReceivedAggression r;
    for (const auto& a : agents) {
        if (a.alive) r.ids.push_back(a.id);
    }
    r.amounts.assign(r.ids.size(), 0.0);

    const std::size_t n = r.ids.size();
    #pragma omp parallel for schedule(static)
    for (std::size_t t = 0; t < n; ++t) {
        const std::uint32_t v = r.ids[t];
        double total = 0.0;
        for (std::uint32_t s : r.ids) {
            if (s != v) total += agents[s].aggression[v];
        }
        r.amounts[t] = total;
    }
    return r;
}

double gini(std::vector<double> values) {
    if (values.empty()) return 0.0;
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    if (sum <= 0.0) return 0.0;

    std::sort(values.begin(), values.end());
    const double n = static_cast<double>(values.size());
    double weighted = 0.0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        weighted += static_cast<double>(i + 1) * values[i];
    }
    const double g = (2.0 * weighted - (n + 1.0) * sum) / (n * sum);
    return std::clamp(g, 0.0, 1.0);
}

double entropy(const std::vector<double>& values) {
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    if (sum <= 0.0) return 0.0;
    double h = 0.0;
    for (double v : values) {
        if (v <= 0.0) continue;
        const double p = v / sum;
        h -= p * std::log2(p);
    }
    return h;
}

double maxShare(const std::vector<double>& values) {
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    if (values.empty() || sum <= 0.0) return 0.0;
    return *std::max_element(values.begin(), values.end()) / sum;
}

double topShare(const std::vector<double>& values, std::size_t k) {
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    if (values.size() < 2 || sum <= 0.0) return 0.0;
    std::vector<double> sorted = values;
    const std::size_t take = std::min(k, sorted.size());
    std::partial_sort(sorted.begin(), sorted.begin() + take, sorted.end(), std::greater<double>());
    return std::accumulate(sorted.begin(), sorted.begin() + take, 0.0) / sum;
}

double convergenceRatio(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    std::vector<double> sorted = values;
    std::partial_sort(sorted.begin(), sorted.begin() + 2, sorted.end(), std::greater<double>());
    const double top1 = sorted[0];
    const double top2 = sorted[1];
    if (top2 > 0.0) return top1 / top2;
    return top1 > 0.0 ? top1 : 0.0;
}

ModalAgreement computeModalAgreement(const std::vector<Agent>& agents, double epsilon) {
    ModalAgreement result;

    std::vector<std::uint32_t> alive;
    for (const auto& a : agents) {
        if (a.alive) alive.push_back(a.id);
    }
    if (alive.size() < 2) return result;

    // Top target per eligible agent; ordered map gives lowest id on count ties
    std::map<std::uint32_t, std::uint32_t> counts;
    for (std::uint32_t i : alive) {
        const auto& row = agents[i].aggression;
        double outgoing = 0.0;
        double best = 0.0;
        std::int64_t best_target = -1;
        for (std::uint32_t j : alive) {
            if (j == i) continue;
            outgoing += row[j];
            // First encountered maximum wins
            if (best_target < 0 || row[j] > best) {
                best = row[j];
                best_target = j;
            }
        }
        if (outgoing < epsilon || best_target < 0) continue;
        ++result.eligible;
        ++counts[static_cast<std::uint32_t>(best_target)];
    }

    if (result.eligible == 0) return result;

    std::uint32_t modal_count = 0;
    for (const auto& [target, count] : counts) {
        if (count > modal_count) {
            modal_count = count;
            result.target = target;
        }
    }
    result.agreement = static_cast<double>(modal_count) / result.eligible;
    return result;
}

double desireConcentration(const std::vector<Agent>& agents) {
    std::vector<double> total;
    for (const auto& a : agents) {
        if (!a.alive) continue;
        if (total.size() < a.desire.size()) total.resize(a.desire.size(), 0.0);
        for (std::size_t o = 0; o < a.desire.size(); ++o) {
            total[o] += a.desire[o];
        }
    }
    const double sum = std::accumulate(total.begin(), total.end(), 0.0);
    if (sum <= 0.0) return 0.0;
    double h = 0.0;
    for (double t : total) {
        const double share = t / sum;
        h += share * share;
    }
    return h;
}

std::size_t timeToThreshold(const std::vector<double>& series, double level, std::size_t consecutive) {
    const std::size_t n = series.size();
    if (consecutive == 0) return 0;
    std::size_t run = 0;
    for (std::size_t t = 0; t < n; ++t) {
        run = series[t] >= level ? run + 1 : 0;
        if (run == consecutive) return t + 1 - consecutive;
    }
    return n;
}

StepMetrics computeStepMetrics(const std::vector<Agent>& agents, double modalEpsilon) {
    StepMetrics m;
    const ReceivedAggression received = computeReceivedAggression(agents);
    const auto& r = received.amounts;

    m.tension = received.total();
    m.activeAgents = static_cast<std::uint32_t>(received.ids.size());
    m.gini = gini(r);
    m.entropy = entropy(r);
    m.maxShare = maxShare(r);
    m.convergenceRatio = convergenceRatio(r);
    m.top3Share = topShare(r, 3);
    if (!r.empty()) {
        m.meanAggression = m.tension / static_cast<double>(r.size());
        m.topTargetAggression = *std::max_element(r.begin(), r.end());
    }

    const ModalAgreement modal = computeModalAgreement(agents, modalEpsilon);
    m.modalAgreement = modal.agreement;
    m.eligibleAgents = modal.eligible;

    double desire_sum = 0.0;
    std::size_t desire_count = 0;
    for (const auto& a : agents) {
        if (!a.alive || a.desire.empty()) continue;
        desire_sum += std::accumulate(a.desire.begin(), a.desire.end(), 0.0) / a.desire.size();
        ++desire_count;
    }
    m.meanDesire = desire_count > 0 ? desire_sum / desire_count : 0.0;
    m.desireConcentration = desireConcentration(agents);
    return m;
}

void MetricsHistory::append(const StepMetrics& m) {
    tension.push_back(m.tension);
    gini.push_back(m.gini);
    entropy.push_back(m.entropy);
    maxShare.push_back(m.maxShare);
    convergenceRatio.push_back(m.convergenceRatio);
    modalAgreement.push_back(m.modalAgreement);
    eligibleAgents.push_back(m.eligibleAgents);
    activeAgents.push_back(m.activeAgents);
    meanAggression.push_back(m.meanAggression);
    topTargetAggression.push_back(m.topTargetAggression);
    top3Share.push_back(m.top3Share);
    meanDesire.push_back(m.meanDesire);
    desireConcentration.push_back(m.desireConcentration);
}

void MetricsHistory::clear() {
    *this = MetricsHistory{};
}
