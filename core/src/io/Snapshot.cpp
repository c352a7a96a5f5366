#include "io/Snapshot.h"
#include <sstream>
#include <iomanip>
#include <ostream>

namespace {

void writeMetricsRow(std::ostream& out, std::uint64_t gen, const StepMetrics& m) {
    out << gen << ","
        << m.tension << ","
        << m.gini << ","
        << m.entropy << ","
        << m.maxShare << ","
        << m.convergenceRatio << ","
        << m.modalAgreement << ","
        << m.eligibleAgents << ","
        << m.activeAgents << ","
        << m.meanAggression << ","
        << m.topTargetAggression << ","
        << m.top3Share << ","
        << m.meanDesire << ","
        << m.desireConcentration << "\n";
}

}  // namespace

std::string historyToJson(const Kernel& kernel) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);

    const auto& cfg = kernel.config();
    auto m = kernel.computeMetrics();

    os << "{";
    os << "\"generation\":" << kernel.generation() << ",";
    os << "\"config\":{";
    os << "\"population\":" << cfg.population << ",";
    os << "\"source\":\"" << toString(cfg.source) << "\",";
    os << "\"spread\":\"" << toString(cfg.spread) << "\",";
    os << "\"alpha\":" << cfg.alpha << ",";
    os << "\"gamma\":" << cfg.salienceExponent << ",";
    os << "\"threshold\":";
    if (cfg.expulsionThreshold) {
        os << *cfg.expulsionThreshold;
    } else {
        os << "null";
    }
    os << ",\"seed\":" << cfg.seed;
    os << "},";

    os << "\"metrics\":{";
    os << "\"tension\":" << m.tension << ",";
    os << "\"gini\":" << m.gini << ",";
    os << "\"entropy\":" << m.entropy << ",";
    os << "\"maxShare\":" << m.maxShare << ",";
    os << "\"convergenceRatio\":" << m.convergenceRatio << ",";
    os << "\"modalAgreement\":" << m.modalAgreement << ",";
    os << "\"eligibleAgents\":" << m.eligibleAgents << ",";
    os << "\"activeAgents\":" << m.activeAgents;
    os << "},";
    os << "\"recordedSteps\":" << kernel.history().size() << ",";

    const auto& log = kernel.eventLog();
    os << "\"expulsions\":[";
    const auto& ex = log.expulsions();
    for (std::size_t i = 0; i < ex.size(); ++i) {
        os << "{\"step\":" << ex[i].step
           << ",\"victim\":" << ex[i].victim
           << ",\"received\":" << ex[i].received << "}";
        if (i + 1 < ex.size()) os << ",";
    }
    os << "],";

    os << "\"catharsis\":[";
    const auto& ca = log.catharsis();
    for (std::size_t i = 0; i < ca.size(); ++i) {
        os << "{\"step\":" << ca[i].step
           << ",\"victim\":" << ca[i].victim
           << ",\"drop\":" << ca[i].drop << "}";
        if (i + 1 < ca.size()) os << ",";
    }
    os << "]";
    os << "}";

    return os.str();
}

void logMetricsHeader(std::ostream& out) {
    out << "gen,tension,gini,entropy,max_share,convergence_ratio,modal_agreement,"
           "eligible,active,mean_aggression,top_target_aggression,top3_share,"
           "mean_desire,desire_concentration\n";
}

void logMetrics(const Kernel& kernel, std::ostream& out) {
    writeMetricsRow(out, kernel.generation(), kernel.computeMetrics());
}

void writeHistoryCsv(const Kernel& kernel, std::ostream& out) {
    const auto& h = kernel.history();
    logMetricsHeader(out);
    for (std::size_t t = 0; t < h.size(); ++t) {
        StepMetrics m;
        m.tension = h.tension[t];
        m.gini = h.gini[t];
        m.entropy = h.entropy[t];
        m.maxShare = h.maxShare[t];
        m.convergenceRatio = h.convergenceRatio[t];
        m.modalAgreement = h.modalAgreement[t];
        m.eligibleAgents = h.eligibleAgents[t];
        m.activeAgents = h.activeAgents[t];
        m.meanAggression = h.meanAggression[t];
        m.topTargetAggression = h.topTargetAggression[t];
        m.top3Share = h.top3Share[t];
        m.meanDesire = h.meanDesire[t];
        m.desireConcentration = h.desireConcentration[t];
        writeMetricsRow(out, t, m);
    }
}
