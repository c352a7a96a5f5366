#ifndef KERNEL_H
#define KERNEL_H

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "kernel/Agent.h"
#include "kernel/Network.h"
#include "modules/AggressionSource.h"
#include "modules/AggressionSpread.h"
#include "modules/ConvergenceMetrics.h"
#include "modules/Desire.h"
#include "modules/Expulsion.h"
#include "modules/Prestige.h"
#include "modules/Status.h"
#include "utils/EventLog.h"

// ---------- Tuning Constants ----------
// Fixed constants of the model that are not exposed as run parameters.
namespace TuningConstants {
    // Baseline prestige weight range, drawn per directed edge
    constexpr double kPrestigeMin = 0.1;
    constexpr double kPrestigeMax = 1.0;

    // Outgoing aggression below this makes an agent ineligible for modal agreement
    constexpr double kModalEligibilityEps = 1e-8;

    // Threshold contagion
    constexpr double kHostileMargin = 0.01;          // above-median margin for "hostile" neighbors
    constexpr double kSubThresholdRetention = 0.95;  // fade factor below threshold
    constexpr double kThresholdSpreadLow = 0.5;      // personal threshold ~ U(low*f, high*f)
    constexpr double kThresholdSpreadHigh = 1.5;

    // Seed offset for topology sampling
    constexpr std::uint64_t kNetworkSeedMix = 0x9E3779B97F4A7C15ULL;
}

// ---------- Mode selectors ----------
enum class SourceMode { Object, Status };
enum class SpreadMode { Linear, Attention, Threshold };

// Throw std::invalid_argument for unknown names
SourceMode parseSourceMode(const std::string& name);
SpreadMode parseSpreadMode(const std::string& name);
const char* toString(SourceMode mode);
const char* toString(SpreadMode mode);

// ---------- Configuration ----------
struct KernelConfig {
    // Network
    std::uint32_t population = 50;
    std::uint32_t avgConnections = 6;   // k (even)
    double rewireProb = 0.15;           // p for Watts-Strogatz

    // Objects / desire
    std::uint32_t objects = 8;
    std::uint32_t rivalrousObjects = 5; // the first R objects are rivalrous
    double desireInitMax = 0.3;
    double desireNoise = 0.02;

    // Core dynamics
    double alpha = 0.15;                // autonomy; used by desire and aggression spread
    double rivalryToAggression = 0.2;   // object rivalry coefficient
    double aggressionDecay = 0.03;
    std::optional<double> expulsionThreshold = 8.0;  // nullopt disables expulsion

    // Attention spread
    double salienceExponent = 2.0;      // gamma

    // Status rivalry
    double rivalryIntensity = 0.15;
    double sigmaStatus = 0.10;          // proximity scale
    double betaUp = 1.0;                // upward bias
    double cStatus = 0.5;               // prestige status baseline
    double statusInitLow = 0.4;
    double statusInitHigh = 0.6;
    double statusLossRate = 0.005;
    double eps = 1e-12;

    // Threshold contagion spread
    double thresholdFraction = 0.3;
    double thresholdBoost = 0.8;

    // Run
    int steps = 600;
    bool recordHistory = true;
    std::uint64_t seed = 42;

    SourceMode source = SourceMode::Object;
    SpreadMode spread = SpreadMode::Attention;
};

// Canonical variants: LM (object, linear), AC (object, attention),
// RL (status, linear), RA (status, attention).
void applyVariant(KernelConfig& cfg, const std::string& variant);

// ---------- Kernel Engine ----------
class Kernel {
public:
    explicit Kernel(const KernelConfig& cfg);
    // Use a topology supplied by an external generator
    Kernel(const KernelConfig& cfg, Network network);

    // Lifecycle. A supplied topology survives reset; its size must match
    // the new population.
    void reset(const KernelConfig& cfg);
    void step();
    void stepN(int n);
    void run();  // cfg.steps steps

    // Phases, in the order step() runs them. Callers may invoke them one by
    // one to observe or replace a phase; finishStep() closes the step.
    void refreshPrestige();
    void updateDesire();
    void sourceAggression();
    void spreadAggression();
    void decayAggression();
    std::optional<ExpulsionOutcome> checkExpulsion();
    void updateStatus();
    void recordMetrics();
    void finishStep();

    // Access
    const KernelConfig& config() const { return cfg_; }
    const std::vector<Agent>& agents() const { return agents_; }
    std::vector<Agent>& agentsMut() { return agents_; }
    const Network& network() const { return network_; }
    const PrestigeWeights& prestige() const { return prestige_; }
    const MetricsHistory& history() const { return history_; }
    const EventLog& eventLog() const { return event_log_; }
    std::uint64_t generation() const { return generation_; }
    bool statusMode() const { return cfg_.source == SourceMode::Status; }
    std::uint32_t aliveCount() const;

    ReceivedAggression receivedAggression() const;
    StepMetrics computeMetrics() const;
    ModalAgreement modalAgreement() const;

private:
    void validateConfig(const KernelConfig& cfg) const;
    void initialize(Network network);
    void initAgents();
    void checkInvariants() const;

    KernelConfig cfg_;
    std::vector<Agent> agents_;
    Network network_;
    std::optional<Network> supplied_network_;  // external topology, reused by reset()
    PrestigeWeights prestige_;
    std::uint64_t generation_ = 0;
    std::mt19937_64 rng_;

    DesireModule desire_;
    std::unique_ptr<AggressionSource> source_;
    std::unique_ptr<AggressionSpread> spread_;
    ExpulsionModule expulsion_;
    StatusModule status_;

    MetricsHistory history_;
    EventLog event_log_;
};

// Independent runs with seeds seed, seed + 1000, seed + 2000, ...
std::vector<Kernel> runMany(const KernelConfig& cfg, int runs);

#endif // KERNEL_H
