#include <gtest/gtest.h>
#include "kernel/Kernel.h"
#include <algorithm>
#include <numeric>

namespace {

double sum(const std::vector<double>& v) {
    return std::accumulate(v.begin(), v.end(), 0.0);
}

std::vector<Agent> makeAgents(std::uint32_t n) {
    std::vector<Agent> agents(n);
    for (std::uint32_t i = 0; i < n; ++i) {
        agents[i].id = i;
        agents[i].desire.assign(2, 0.1);
        agents[i].aggression.assign(n, 0.0);
    }
    return agents;
}

// Triangle 0-1-2, agent 3 connected only to 2, agent 4 isolated
struct SpreadFixture : public ::testing::Test {
    void SetUp() override {
        network = Network::fromEdges(5, {{0, 1}, {1, 2}, {0, 2}, {2, 3}});
        std::mt19937_64 rng(11);
        prestige.initialize(network, rng);
        agents = makeAgents(5);

        agents[0].aggression = {0.0, 0.2, 0.1, 0.7, 0.0};
        agents[1].aggression = {0.3, 0.0, 0.0, 1.2, 0.5};
        agents[2].aggression = {0.6, 0.1, 0.0, 0.2, 0.9};
        agents[3].aggression = {0.0, 0.0, 0.4, 0.0, 0.0};
        agents[4].aggression = {0.8, 0.0, 0.0, 0.0, 0.0};

        cfg.alpha = 0.3;
    }

    Network network;
    PrestigeWeights prestige;
    std::vector<Agent> agents;
    KernelConfig cfg;
};

}  // namespace

TEST(AttentionPullTest, ConservesMassForAnyGamma) {
    const std::vector<double> h = {0.0, 0.3, 1.7, 0.05, 0.0, 2.2, 0.9};
    for (double gamma : {0.0, 0.25, 0.5, 1.0, 2.0, 3.5, 8.0}) {
        auto pull = attentionPull(h, gamma);
        ASSERT_EQ(pull.size(), h.size());
        EXPECT_NEAR(sum(pull), sum(h), 1e-12) << "gamma=" << gamma;
        // Zero hostility is never given attention
        EXPECT_DOUBLE_EQ(pull[0], 0.0);
        EXPECT_DOUBLE_EQ(pull[4], 0.0);
    }
}

TEST(AttentionPullTest, GammaOneIsIdentity) {
    const std::vector<double> h = {0.4, 0.0, 1.1, 0.25};
    auto pull = attentionPull(h, 1.0);
    for (std::size_t j = 0; j < h.size(); ++j) {
        EXPECT_NEAR(pull[j], h[j], 1e-12);
    }
}

TEST(AttentionPullTest, GammaZeroSpreadsEvenlyOverSupport) {
    auto pull = attentionPull({0.0, 1.0, 3.0}, 0.0);
    EXPECT_DOUBLE_EQ(pull[0], 0.0);
    EXPECT_DOUBLE_EQ(pull[1], 2.0);
    EXPECT_DOUBLE_EQ(pull[2], 2.0);
}

TEST(AttentionPullTest, LargeGammaConcentratesOnPeak) {
    auto pull = attentionPull({1.0, 2.0, 1.0}, 2.0);
    // weights 1:4:1 of total 4
    EXPECT_NEAR(pull[0], 4.0 / 6.0, 1e-12);
    EXPECT_NEAR(pull[1], 16.0 / 6.0, 1e-12);
    EXPECT_NEAR(pull[2], 4.0 / 6.0, 1e-12);
}

TEST(AttentionPullTest, ZeroMassGivesZeroVector) {
    for (double gamma : {0.0, 1.0, 2.0}) {
        auto pull = attentionPull({0.0, 0.0, 0.0}, gamma);
        EXPECT_DOUBLE_EQ(sum(pull), 0.0);
    }
    EXPECT_TRUE(attentionPull({}, 2.0).empty());
}

TEST_F(SpreadFixture, LinearRowMatchesWeightedMean) {
    const auto before = agents;
    auto spread = AggressionSpread::create(SpreadMode::Linear);
    spread->apply(agents, network, prestige, cfg);

    // Agent 0 listens to 1 and 2
    const double w1 = prestige.weight(0, 1);
    const double w2 = prestige.weight(0, 2);
    for (std::uint32_t j = 1; j < 5; ++j) {
        const double h = (w1 * before[1].aggression[j] + w2 * before[2].aggression[j]) / (w1 + w2);
        EXPECT_NEAR(agents[0].aggression[j], cfg.alpha * before[0].aggression[j] + (1.0 - cfg.alpha) * h,
                    1e-12) << "target " << j;
    }
    EXPECT_DOUBLE_EQ(agents[0].aggression[0], 0.0);

    // Isolated agent keeps its row
    EXPECT_EQ(agents[4].aggression, before[4].aggression);
}

TEST_F(SpreadFixture, AttentionWithGammaOneMatchesLinear) {
    auto linearAgents = agents;
    cfg.salienceExponent = 1.0;

    AggressionSpread::create(SpreadMode::Linear)->apply(linearAgents, network, prestige, cfg);
    AggressionSpread::create(SpreadMode::Attention)->apply(agents, network, prestige, cfg);

    for (std::uint32_t i = 0; i < agents.size(); ++i) {
        for (std::uint32_t j = 0; j < agents.size(); ++j) {
            EXPECT_NEAR(agents[i].aggression[j], linearAgents[i].aggression[j], 1e-12);
        }
    }
}

TEST_F(SpreadFixture, RowsUseOldStateOnly) {
    // Agent 3's new row comes from agent 2's row before agent 2 is updated
    const auto before = agents;
    AggressionSpread::create(SpreadMode::Linear)->apply(agents, network, prestige, cfg);

    for (std::uint32_t j = 0; j < 5; ++j) {
        const double expected = j == 3 ? 0.0
            : cfg.alpha * before[3].aggression[j] + (1.0 - cfg.alpha) * before[2].aggression[j];
        EXPECT_NEAR(agents[3].aggression[j], expected, 1e-12);
    }
}

TEST_F(SpreadFixture, DeadTargetsAndNeighborsAreMasked) {
    agents[1].alive = false;
    std::fill(agents[1].aggression.begin(), agents[1].aggression.end(), 0.0);
    for (auto& a : agents) a.aggression[1] = 0.0;
    const auto before = agents;

    AggressionSpread::create(SpreadMode::Attention)->apply(agents, network, prestige, cfg);

    for (const auto& a : agents) {
        EXPECT_DOUBLE_EQ(a.aggression[a.id], 0.0);
        EXPECT_DOUBLE_EQ(a.aggression[1], 0.0);
    }
    // The dead agent's row is left alone
    EXPECT_EQ(agents[1].aggression, before[1].aggression);

    // Agent 0 now only hears agent 2
    const std::vector<double> pull = attentionPull(
        {0.0, 0.0, 0.0, before[2].aggression[3], before[2].aggression[4]}, cfg.salienceExponent);
    EXPECT_NEAR(agents[0].aggression[3],
                cfg.alpha * before[0].aggression[3] + (1.0 - cfg.alpha) * pull[3], 1e-12);
    EXPECT_NEAR(agents[0].aggression[4],
                cfg.alpha * before[0].aggression[4] + (1.0 - cfg.alpha) * pull[4], 1e-12);
}

TEST(ThresholdSpreadTest, ThresholdsDrawnAroundFraction) {
    KernelConfig cfg;
    cfg.thresholdFraction = 0.3;
    ThresholdSpread spread;
    std::mt19937_64 rng(5);
    spread.initialize(200, cfg, rng);

    ASSERT_EQ(spread.thresholds().size(), 200u);
    for (double t : spread.thresholds()) {
        EXPECT_GE(t, 0.15);
        EXPECT_LE(t, 0.45);
    }
}

TEST(ThresholdSpreadTest, PilesOnAboveThresholdAndFadesBelow) {
    // Agent 0 has neighbors 1, 2, 3; agent 4 is nobody's neighbor
    Network network = Network::fromEdges(5, {{0, 1}, {0, 2}, {0, 3}});
    std::mt19937_64 rng(8);
    PrestigeWeights prestige;
    prestige.initialize(network, rng);

    KernelConfig cfg;
    cfg.thresholdFraction = 0.1;  // personal thresholds in [0.05, 0.15]
    cfg.thresholdBoost = 0.8;
    ThresholdSpread spread;
    spread.initialize(5, cfg, rng);

    auto agents = makeAgents(5);
    agents[0].aggression[1] = 1.0;
    agents[0].aggression[4] = 0.2;
    agents[1].aggression[4] = 1.0;  // one of three neighbors is hostile to 4

    spread.apply(agents, network, prestige, cfg);

    EXPECT_NEAR(agents[0].aggression[4], 0.2 + 0.8 / 3.0, 1e-12);
    EXPECT_NEAR(agents[0].aggression[1], 0.95, 1e-12);
    EXPECT_DOUBLE_EQ(agents[0].aggression[0], 0.0);
}

TEST(LinearSpreadTest, WeightsFollowAdjacencyOrderNotIds) {
    // Agent 0 lists neighbor 3 before neighbor 1
    Network network = Network::fromEdges(4, {{0, 3}, {0, 1}, {1, 2}});
    ASSERT_EQ(network.neighbors(0).front(), 3u);
    std::mt19937_64 rng(21);
    PrestigeWeights prestige;
    prestige.initialize(network, rng);

    KernelConfig cfg;
    cfg.alpha = 0.4;
    auto agents = makeAgents(4);
    agents[1].aggression = {0.5, 0.0, 1.0, 0.0};
    agents[3].aggression = {0.9, 0.2, 0.0, 0.0};
    const auto before = agents;

    AggressionSpread::create(SpreadMode::Linear)->apply(agents, network, prestige, cfg);

    const double w1 = prestige.weight(0, 1);
    const double w3 = prestige.weight(0, 3);
    for (std::uint32_t j = 1; j < 4; ++j) {
        const double h = (w1 * before[1].aggression[j] + w3 * before[3].aggression[j]) / (w1 + w3);
        EXPECT_NEAR(agents[0].aggression[j], (1.0 - cfg.alpha) * h, 1e-12) << "target " << j;
    }
}
