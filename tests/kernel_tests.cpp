#include <gtest/gtest.h>
#include "kernel/Kernel.h"
#include "io/Snapshot.h"
#include <sstream>
#include <stdexcept>

namespace {

KernelConfig smallConfig() {
    KernelConfig cfg;
    cfg.population = 30;
    cfg.steps = 100;
    cfg.seed = 12345;
    return cfg;
}

void expectInvariants(const Kernel& kernel) {
    for (const auto& agent : kernel.agents()) {
        for (double d : agent.desire) {
            ASSERT_GE(d, 0.0);
        }
        if (kernel.statusMode()) {
            ASSERT_GE(agent.status, 0.0);
            ASSERT_LE(agent.status, 1.0);
        }
        ASSERT_EQ(agent.aggression[agent.id], 0.0);
        for (const auto& target : kernel.agents()) {
            if (!target.alive) {
                ASSERT_EQ(agent.aggression[target.id], 0.0)
                    << "agent " << agent.id << " still targets expelled " << target.id;
            }
        }
    }
}

}  // namespace

// Basic kernel initialization test
TEST(KernelTest, Initialization) {
    KernelConfig cfg = smallConfig();
    Kernel kernel(cfg);

    ASSERT_EQ(kernel.agents().size(), cfg.population);
    EXPECT_EQ(kernel.network().size(), cfg.population);
    EXPECT_EQ(kernel.generation(), 0u);
    EXPECT_EQ(kernel.aliveCount(), cfg.population);
    EXPECT_TRUE(kernel.history().empty());
    EXPECT_TRUE(kernel.eventLog().empty());

    for (const auto& a : kernel.agents()) {
        ASSERT_EQ(a.desire.size(), cfg.objects);
        ASSERT_EQ(a.aggression.size(), cfg.population);
        for (double d : a.desire) {
            EXPECT_GE(d, 0.0);
            EXPECT_LE(d, cfg.desireInitMax);
        }
        for (double x : a.aggression) {
            EXPECT_DOUBLE_EQ(x, 0.0);
        }
        EXPECT_DOUBLE_EQ(a.status, 0.0);
    }
}

TEST(KernelTest, StatusModeDrawsInitialStatus) {
    KernelConfig cfg = smallConfig();
    applyVariant(cfg, "RA");
    Kernel kernel(cfg);

    EXPECT_TRUE(kernel.statusMode());
    for (const auto& a : kernel.agents()) {
        EXPECT_GE(a.status, cfg.statusInitLow);
        EXPECT_LE(a.status, cfg.statusInitHigh);
    }
}

TEST(KernelTest, ModeNames) {
    EXPECT_EQ(parseSourceMode("object"), SourceMode::Object);
    EXPECT_EQ(parseSourceMode("status"), SourceMode::Status);
    EXPECT_EQ(parseSpreadMode("linear"), SpreadMode::Linear);
    EXPECT_EQ(parseSpreadMode("attention"), SpreadMode::Attention);
    EXPECT_EQ(parseSpreadMode("threshold"), SpreadMode::Threshold);
    EXPECT_STREQ(toString(SpreadMode::Attention), "attention");

    EXPECT_THROW(parseSourceMode("marginality"), std::invalid_argument);
    EXPECT_THROW(parseSpreadMode("Linear"), std::invalid_argument);
    EXPECT_THROW(parseSpreadMode(""), std::invalid_argument);
}

TEST(KernelTest, VariantsMapToModes) {
    KernelConfig cfg;
    applyVariant(cfg, "LM");
    EXPECT_EQ(cfg.source, SourceMode::Object);
    EXPECT_EQ(cfg.spread, SpreadMode::Linear);
    applyVariant(cfg, "RA");
    EXPECT_EQ(cfg.source, SourceMode::Status);
    EXPECT_EQ(cfg.spread, SpreadMode::Attention);
    applyVariant(cfg, "RL");
    EXPECT_EQ(cfg.spread, SpreadMode::Linear);
    applyVariant(cfg, "AC");
    EXPECT_EQ(cfg.source, SourceMode::Object);
    EXPECT_EQ(cfg.spread, SpreadMode::Attention);

    EXPECT_THROW(applyVariant(cfg, "XX"), std::invalid_argument);
}

TEST(KernelTest, RejectsInvalidConfig) {
    KernelConfig cfg = smallConfig();
    cfg.population = 0;
    EXPECT_THROW(Kernel{cfg}, std::invalid_argument);

    cfg = smallConfig();
    cfg.alpha = 1.5;
    EXPECT_THROW(Kernel{cfg}, std::invalid_argument);

    cfg = smallConfig();
    cfg.rivalrousObjects = cfg.objects + 1;
    EXPECT_THROW(Kernel{cfg}, std::invalid_argument);

    cfg = smallConfig();
    cfg.sigmaStatus = 0.0;
    EXPECT_THROW(Kernel{cfg}, std::invalid_argument);

    cfg = smallConfig();
    cfg.statusInitLow = 0.7;
    cfg.statusInitHigh = 0.6;
    EXPECT_THROW(Kernel{cfg}, std::invalid_argument);

    cfg = smallConfig();
    cfg.salienceExponent = -1.0;
    EXPECT_THROW(Kernel{cfg}, std::invalid_argument);
}

TEST(KernelTest, ExternalNetwork) {
    KernelConfig cfg = smallConfig();
    cfg.population = 6;
    std::vector<std::pair<std::uint32_t, std::uint32_t>> ring;
    for (std::uint32_t i = 0; i < 6; ++i) ring.emplace_back(i, (i + 1) % 6);

    Kernel kernel(cfg, Network::fromEdges(6, ring));
    EXPECT_EQ(kernel.network().edgeCount(), 6u);
    EXPECT_EQ(kernel.network().hops(0, 3), 3u);
    kernel.stepN(5);
    EXPECT_EQ(kernel.generation(), 5u);

    EXPECT_THROW(Kernel mismatched(cfg, Network::fromEdges(4, {{0, 1}})), std::invalid_argument);
}

TEST(KernelTest, ResetKeepsSuppliedNetwork) {
    KernelConfig cfg = smallConfig();
    cfg.population = 6;
    std::vector<std::pair<std::uint32_t, std::uint32_t>> ring;
    for (std::uint32_t i = 0; i < 6; ++i) ring.emplace_back(i, (i + 1) % 6);

    Kernel kernel(cfg, Network::fromEdges(6, ring));
    kernel.stepN(5);

    cfg.seed = 777;
    kernel.reset(cfg);
    EXPECT_EQ(kernel.generation(), 0u);
    EXPECT_EQ(kernel.network().edgeCount(), 6u);
    EXPECT_EQ(kernel.network().hops(0, 3), 3u);
    for (std::uint32_t i = 0; i < 6; ++i) {
        EXPECT_TRUE(kernel.network().hasEdge(i, (i + 1) % 6));
    }

    // The ring cannot host a different population
    KernelConfig bigger = cfg;
    bigger.population = 8;
    EXPECT_THROW(kernel.reset(bigger), std::invalid_argument);
    EXPECT_EQ(kernel.network().size(), 6u);
}

TEST(KernelTest, RejectsUnknownModes) {
    KernelConfig cfg = smallConfig();
    cfg.spread = static_cast<SpreadMode>(7);
    EXPECT_THROW(Kernel{cfg}, std::invalid_argument);

    cfg = smallConfig();
    cfg.source = static_cast<SourceMode>(5);
    EXPECT_THROW(Kernel{cfg}, std::invalid_argument);
}

TEST(KernelTest, FailedResetLeavesStateIntact) {
    KernelConfig cfg = smallConfig();
    Kernel kernel(cfg);
    kernel.stepN(7);
    const auto agentsBefore = kernel.agents();
    const auto tensionBefore = kernel.history().tension;

    KernelConfig bad = cfg;
    bad.spread = static_cast<SpreadMode>(9);
    EXPECT_THROW(kernel.reset(bad), std::invalid_argument);

    EXPECT_EQ(kernel.generation(), 7u);
    EXPECT_EQ(kernel.history().tension, tensionBefore);
    ASSERT_EQ(kernel.agents().size(), agentsBefore.size());
    for (std::size_t i = 0; i < agentsBefore.size(); ++i) {
        EXPECT_EQ(kernel.agents()[i].aggression, agentsBefore[i].aggression);
        EXPECT_EQ(kernel.agents()[i].desire, agentsBefore[i].desire);
    }

    // Still steps with the old configuration
    kernel.step();
    EXPECT_EQ(kernel.generation(), 8u);
}

// Same seed, same run
TEST(KernelTest, DeterministicUpdates) {
    for (const char* variant : {"LM", "AC", "RL", "RA"}) {
        KernelConfig cfg = smallConfig();
        applyVariant(cfg, variant);
        cfg.expulsionThreshold = 3.0;

        Kernel kernel1(cfg);
        Kernel kernel2(cfg);
        kernel1.stepN(80);
        kernel2.stepN(80);

        EXPECT_EQ(kernel1.history().tension, kernel2.history().tension) << variant;
        EXPECT_EQ(kernel1.history().modalAgreement, kernel2.history().modalAgreement) << variant;
        EXPECT_EQ(kernel1.history().meanDesire, kernel2.history().meanDesire) << variant;

        const auto& ev1 = kernel1.eventLog().expulsions();
        const auto& ev2 = kernel2.eventLog().expulsions();
        ASSERT_EQ(ev1.size(), ev2.size()) << variant;
        for (std::size_t e = 0; e < ev1.size(); ++e) {
            EXPECT_EQ(ev1[e].step, ev2[e].step);
            EXPECT_EQ(ev1[e].victim, ev2[e].victim);
            EXPECT_EQ(ev1[e].received, ev2[e].received);
        }
    }
}

TEST(KernelTest, DifferentSeedsDiverge) {
    KernelConfig cfg = smallConfig();
    Kernel kernel1(cfg);
    cfg.seed += 1;
    Kernel kernel2(cfg);
    kernel1.stepN(20);
    kernel2.stepN(20);
    EXPECT_NE(kernel1.history().tension, kernel2.history().tension);
}

TEST(KernelTest, InvariantsHoldEveryStep) {
    for (SpreadMode spread : {SpreadMode::Linear, SpreadMode::Attention, SpreadMode::Threshold}) {
        for (SourceMode source : {SourceMode::Object, SourceMode::Status}) {
            KernelConfig cfg = smallConfig();
            cfg.source = source;
            cfg.spread = spread;
            cfg.expulsionThreshold = 2.0;
            Kernel kernel(cfg);

            std::vector<bool> wasDead(cfg.population, false);
            for (int t = 0; t < 150; ++t) {
                kernel.step();
                expectInvariants(kernel);
                for (const auto& a : kernel.agents()) {
                    if (wasDead[a.id]) {
                        ASSERT_FALSE(a.alive) << "agent " << a.id << " came back";
                    }
                    wasDead[a.id] = !a.alive;
                }
            }
            EXPECT_EQ(kernel.aliveCount() + kernel.eventLog().expulsions().size(), cfg.population);
        }
    }
}

TEST(KernelTest, NoExpulsionWhenDisabled) {
    KernelConfig cfg = smallConfig();
    cfg.expulsionThreshold.reset();
    cfg.rivalryToAggression = 5.0;
    Kernel kernel(cfg);
    kernel.stepN(300);

    EXPECT_TRUE(kernel.eventLog().expulsions().empty());
    EXPECT_TRUE(kernel.eventLog().catharsis().empty());
    EXPECT_EQ(kernel.aliveCount(), cfg.population);
    EXPECT_GT(kernel.computeMetrics().tension, 0.0);
}

// One catharsis entry per expulsion, each in [0,1]
TEST(KernelTest, CatharsisRecordedPerExpulsion) {
    KernelConfig cfg = smallConfig();
    cfg.expulsionThreshold = 2.0;
    Kernel kernel(cfg);
    kernel.stepN(200);

    const auto& log = kernel.eventLog();
    ASSERT_FALSE(log.expulsions().empty());
    ASSERT_EQ(log.catharsis().size(), log.expulsions().size());
    for (std::size_t e = 0; e < log.catharsis().size(); ++e) {
        EXPECT_EQ(log.catharsis()[e].victim, log.expulsions()[e].victim);
        EXPECT_GE(log.catharsis()[e].drop, 0.0);
        EXPECT_LE(log.catharsis()[e].drop, 1.0);
        EXPECT_GE(log.expulsions()[e].received, 2.0);
    }
}

TEST(KernelTest, PhasesComposeToStep) {
    KernelConfig cfg = smallConfig();
    applyVariant(cfg, "RA");
    cfg.expulsionThreshold = 3.0;
    Kernel whole(cfg);
    Kernel phased(cfg);

    for (int t = 0; t < 40; ++t) {
        whole.step();

        phased.refreshPrestige();
        phased.updateDesire();
        phased.sourceAggression();
        phased.refreshPrestige();
        phased.spreadAggression();
        phased.decayAggression();
        auto outcome = phased.checkExpulsion();
        if (outcome) {
            EXPECT_TRUE(phased.eventLog().wasExpelled(outcome->victim));
        }
        phased.updateStatus();
        phased.finishStep();
    }

    ASSERT_EQ(whole.generation(), phased.generation());
    for (std::size_t i = 0; i < whole.agents().size(); ++i) {
        EXPECT_EQ(whole.agents()[i].desire, phased.agents()[i].desire);
        EXPECT_EQ(whole.agents()[i].aggression, phased.agents()[i].aggression);
        EXPECT_EQ(whole.agents()[i].status, phased.agents()[i].status);
    }
}

TEST(KernelTest, MetricsComputation) {
    KernelConfig cfg = smallConfig();
    Kernel kernel(cfg);
    kernel.stepN(50);

    ASSERT_EQ(kernel.history().size(), 50u);
    auto m = kernel.computeMetrics();
    EXPECT_EQ(m.activeAgents, kernel.aliveCount());
    EXPECT_GE(m.gini, 0.0);
    EXPECT_LE(m.gini, 1.0);
    EXPECT_GE(m.modalAgreement, 0.0);
    EXPECT_LE(m.modalAgreement, 1.0);
    EXPECT_LE(m.eligibleAgents, m.activeAgents);
    EXPECT_NEAR(m.tension, kernel.receivedAggression().total(), 1e-9);
    EXPECT_DOUBLE_EQ(kernel.history().tension.back(), m.tension);
}

TEST(KernelTest, HistoryCanBeDisabled) {
    KernelConfig cfg = smallConfig();
    cfg.recordHistory = false;
    cfg.expulsionThreshold = 2.0;
    Kernel kernel(cfg);
    kernel.stepN(100);

    EXPECT_EQ(kernel.generation(), 100u);
    EXPECT_TRUE(kernel.history().empty());
    EXPECT_FALSE(kernel.eventLog().expulsions().empty());
}

TEST(KernelTest, ResetRestartsRun) {
    KernelConfig cfg = smallConfig();
    cfg.expulsionThreshold = 2.0;
    Kernel kernel(cfg);
    kernel.stepN(60);
    const auto firstTension = kernel.history().tension;
    const auto firstExpelled = kernel.eventLog().expulsions().size();

    kernel.reset(cfg);
    EXPECT_EQ(kernel.generation(), 0u);
    EXPECT_TRUE(kernel.history().empty());
    EXPECT_TRUE(kernel.eventLog().empty());
    EXPECT_EQ(kernel.aliveCount(), cfg.population);

    kernel.stepN(60);
    EXPECT_EQ(kernel.history().tension, firstTension);
    EXPECT_EQ(kernel.eventLog().expulsions().size(), firstExpelled);
}

TEST(KernelTest, RunManyUsesSpacedSeeds) {
    KernelConfig cfg = smallConfig();
    cfg.population = 20;
    cfg.steps = 25;
    auto runs = runMany(cfg, 3);

    ASSERT_EQ(runs.size(), 3u);
    for (std::size_t r = 0; r < runs.size(); ++r) {
        EXPECT_EQ(runs[r].config().seed, cfg.seed + r * 1000);
        EXPECT_EQ(runs[r].generation(), 25u);
        EXPECT_EQ(runs[r].history().size(), 25u);
    }
    EXPECT_TRUE(runMany(cfg, 0).empty());
}

TEST(SnapshotTest, HistoryExport) {
    KernelConfig cfg = smallConfig();
    cfg.expulsionThreshold = 2.0;
    Kernel kernel(cfg);
    kernel.stepN(30);

    const std::string json = historyToJson(kernel);
    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_NE(json.find("\"generation\":30"), std::string::npos);
    EXPECT_NE(json.find("\"spread\":\"attention\""), std::string::npos);
    EXPECT_NE(json.find("\"expulsions\":[{"), std::string::npos);

    std::ostringstream csv;
    writeHistoryCsv(kernel, csv);
    std::istringstream lines(csv.str());
    std::string line;
    std::size_t count = 0;
    while (std::getline(lines, line)) ++count;
    EXPECT_EQ(count, kernel.history().size() + 1);

    cfg.expulsionThreshold.reset();
    kernel.reset(cfg);
    EXPECT_NE(historyToJson(kernel).find("\"threshold\":null"), std::string::npos);
}
