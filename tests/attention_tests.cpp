#include <gtest/gtest.h>
#include "kernel/MultiAgentSystem.h"
#include "modules/SocialAttention.h"

#include <stdexcept>

namespace {

Agent makeAgent(std::uint32_t id, double m, double var = 0.5) {
    Agent a;
    a.id = id;
    a.muQ = Eigen::Vector3d(m, 0.0, 0.0);
    a.sigmaQ = var * Eigen::MatrixXd::Identity(3, 3);
    a.muP = Eigen::VectorXd::Zero(3);
    a.sigmaP = Eigen::MatrixXd::Identity(3, 3);
    return a;
}

MultiAgentSystem lineSystem(const SystemConfig& cfg = {}) {
    std::vector<Agent> agents;
    const double means[] = {0.0, 0.1, 1.0, 3.0};
    for (std::uint32_t i = 0; i < 4; ++i) {
        agents.push_back(makeAgent(i, means[i]));
    }
    return MultiAgentSystem(std::move(agents), cfg);
}

}  // namespace

TEST(AttentionTest, RowsAreStochasticWithZeroDiagonal) {
    auto system = lineSystem();
    const Eigen::MatrixXd beta = computeSocialInfluenceMatrix(system);
    for (Eigen::Index i = 0; i < beta.rows(); ++i) {
        EXPECT_NEAR(beta.row(i).sum(), 1.0, 1e-12);
        EXPECT_DOUBLE_EQ(beta(i, i), 0.0);
        EXPECT_TRUE((beta.row(i).array() >= 0.0).all());
    }
}

TEST(AttentionTest, CloserNeighboursGetMoreAttention) {
    auto system = lineSystem();
    const Eigen::MatrixXd beta = computeSocialInfluenceMatrix(system);
    // Agent 0 at 0.0: agent 1 at 0.1 is closest, agent 3 at 3.0 furthest
    EXPECT_GT(beta(0, 1), beta(0, 2));
    EXPECT_GT(beta(0, 2), beta(0, 3));
}

TEST(AttentionTest, LowTemperatureConcentratesOnNearest) {
    SystemConfig cfg;
    cfg.kappaBeta = 1e-3;
    auto system = lineSystem(cfg);
    const Eigen::MatrixXd beta = computeSocialInfluenceMatrix(system);
    EXPECT_NEAR(beta(0, 1), 1.0, 1e-9);
    EXPECT_NEAR(beta(3, 2), 1.0, 1e-9);
}

TEST(AttentionTest, HighTemperatureIsNearlyUniform) {
    SystemConfig cfg;
    cfg.kappaBeta = 1e6;
    auto system = lineSystem(cfg);
    const Eigen::MatrixXd beta = computeSocialInfluenceMatrix(system);
    for (Eigen::Index j = 1; j < 4; ++j) {
        EXPECT_NEAR(beta(0, j), 1.0 / 3.0, 1e-5);
    }
}

TEST(AttentionTest, HugeKLDoesNotOverflow) {
    Eigen::MatrixXd kl(3, 3);
    kl << 0.0, 1e6, 2e6,
          5e5, 0.0, 1e6,
          1e6, 3e6, 0.0;
    const Eigen::MatrixXd coupling = Eigen::MatrixXd::Ones(3, 3) - Eigen::MatrixXd::Identity(3, 3);
    const Eigen::MatrixXd w = computeSoftmaxWeights(kl, 1.0, coupling);
    EXPECT_TRUE(w.allFinite());
    EXPECT_NEAR(w(0, 1), 1.0, 1e-12);
    EXPECT_NEAR(w(2, 0), 1.0, 1e-12);
}

TEST(AttentionTest, NonPositiveTemperatureThrows) {
    const Eigen::MatrixXd kl = Eigen::MatrixXd::Zero(2, 2);
    const Eigen::MatrixXd coupling = Eigen::MatrixXd::Ones(2, 2);
    EXPECT_THROW(computeSoftmaxWeights(kl, 0.0, coupling), std::domain_error);
    EXPECT_THROW(computeSoftmaxWeights(kl, -1.0, coupling), std::domain_error);
}

TEST(AttentionTest, AgentWithoutNeighboursHasZeroRow) {
    std::vector<Agent> agents;
    for (std::uint32_t i = 0; i < 3; ++i) agents.push_back(makeAgent(i, 0.5 * i));
    // Agent 2 listens to nobody
    MultiAgentSystem system(std::move(agents), SystemConfig{}, MultiAgentSystem::NeighborLists{{1, 2}, {0}, {}});
    const Eigen::MatrixXd beta = computeSocialInfluenceMatrix(system);
    EXPECT_DOUBLE_EQ(beta.row(2).sum(), 0.0);
    EXPECT_DOUBLE_EQ(beta(1, 2), 0.0);
    EXPECT_DOUBLE_EQ(beta(1, 0), 1.0);
}

TEST(AttentionTest, KLMatrixUsesTransport) {
    std::vector<Agent> agents;
    agents.push_back(makeAgent(0, 1.0));
    agents.push_back(makeAgent(1, 1.0));
    agents[1].phi = Eigen::Vector3d(0.0, 0.0, 1.2);
    MultiAgentSystem system(std::move(agents));

    // Identical coordinates but different frames: the transported belief differs
    const Eigen::MatrixXd kl = computeKLMatrix(system, KLMode::Belief);
    EXPECT_GT(kl(0, 1), 1e-3);
    EXPECT_NEAR(kl(0, 1), kl(1, 0), 1e-10);
    EXPECT_DOUBLE_EQ(kl(0, 0), 0.0);
}
