#include <gtest/gtest.h>
#include "geometry/Spd.h"
#include "kernel/MultiAgentSystem.h"
#include "modules/FreeEnergy.h"
#include "modules/Metrics.h"
#include "utils/EventLog.h"

#include <limits>
#include <stdexcept>

TEST(AgentTest, CreationIsDeterministicPerSeed) {
    AgentConfig cfg;
    cfg.gaugeScale = 0.3;
    const auto a = createAgents(5, cfg, 99);
    const auto b = createAgents(5, cfg, 99);
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_TRUE(a[i].muQ == b[i].muQ);
        EXPECT_TRUE(a[i].sigmaQ == b[i].sigmaQ);
        EXPECT_TRUE(a[i].phi == b[i].phi);
        EXPECT_TRUE(isSPD(a[i].sigmaQ));
    }
    // Agent i depends only on seed + i
    const auto shifted = createAgents(4, cfg, 100);
    EXPECT_TRUE(shifted[0].muQ == a[1].muQ);
}

TEST(AgentTest, InvalidConfigThrows) {
    AgentConfig cfg;
    cfg.K = 0;
    std::mt19937_64 rng(1);
    EXPECT_THROW(createAgent(0, cfg, rng), std::invalid_argument);
    cfg.K = 3;
    cfg.sigmaScale = -1.0;
    EXPECT_THROW(createAgent(0, cfg, rng), std::invalid_argument);
}

TEST(SystemTest, RejectsBadPopulations) {
    EXPECT_THROW((MultiAgentSystem{std::vector<Agent>{}}), std::invalid_argument);

    auto agents = createAgents(3, AgentConfig{}, 1);
    agents[1].muQ = Eigen::VectorXd::Zero(2);
    EXPECT_THROW((MultiAgentSystem{agents}), std::invalid_argument);

    agents = createAgents(3, AgentConfig{}, 1);
    agents[2].id = 7;
    EXPECT_THROW((MultiAgentSystem{agents}), std::invalid_argument);

    agents = createAgents(3, AgentConfig{}, 1);
    agents[0].sigmaQ(0, 0) = -1.0;
    EXPECT_THROW((MultiAgentSystem{agents}), std::domain_error);
}

TEST(SystemTest, RejectsBadConfig) {
    SystemConfig cfg;
    cfg.kappaBeta = 0.0;
    EXPECT_THROW((MultiAgentSystem{createAgents(3, AgentConfig{}, 1), cfg}), std::invalid_argument);
    cfg = SystemConfig{};
    cfg.lambdaBeliefAlign = -0.1;
    EXPECT_THROW((MultiAgentSystem{createAgents(3, AgentConfig{}, 1), cfg}), std::invalid_argument);
}

TEST(SystemTest, RejectsBadNeighbourLists) {
    const auto agents = createAgents(3, AgentConfig{}, 1);
    using NL = MultiAgentSystem::NeighborLists;
    EXPECT_THROW((MultiAgentSystem{agents, SystemConfig{}, NL{{1}, {0}}}), std::invalid_argument);
    EXPECT_THROW((MultiAgentSystem{agents, SystemConfig{}, NL{{0}, {}, {}}}), std::invalid_argument);
    EXPECT_THROW((MultiAgentSystem{agents, SystemConfig{}, NL{{5}, {}, {}}}), std::invalid_argument);
    EXPECT_THROW((MultiAgentSystem{agents, SystemConfig{}, NL{{1, 1}, {}, {}}}), std::invalid_argument);
}

TEST(SystemTest, SmallWorldIsSeededAndLoopFree) {
    CouplingConfig cc;
    cc.topology = CouplingTopology::SmallWorld;
    cc.avgConnections = 4;
    cc.rewireProb = 0.3;
    cc.seed = 5;
    MultiAgentSystem a(createAgents(20, AgentConfig{}, 1), SystemConfig{}, cc);
    MultiAgentSystem b(createAgents(20, AgentConfig{}, 1), SystemConfig{}, cc);
    EXPECT_EQ(a.neighbors(), b.neighbors());
    std::size_t edges = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_FALSE(a.coupled(i, i));
        edges += a.neighbors()[i].size();
    }
    // Rewiring moves edges, it does not add or remove them
    EXPECT_EQ(edges, 20u * 4u);
}

TEST(SystemTest, SupportOverlapScalesCoupling) {
    auto agents = createAgents(3, AgentConfig{}, 1);
    BaseManifold m(3);
    agents[0].support = createWindowSupport(m, 0, 0);  // coordinate 0 only
    agents[1].support = createWindowSupport(m, 2, 0);  // coordinate 2 only
    agents[2].support = createFullSupport(m);
    MultiAgentSystem system(std::move(agents));
    EXPECT_DOUBLE_EQ(system.couplingMatrix()(0, 1), 0.0);
    EXPECT_FALSE(system.coupled(0, 1));
    EXPECT_NEAR(system.couplingMatrix()(0, 2), 1.0 / 3.0, 1e-15);
    EXPECT_NEAR(system.couplingMatrix()(2, 2), 0.0, 0.0);
}

TEST(SystemTest, PeriodicManifoldWraps) {
    BaseManifold ring(10, TopologyType::Periodic);
    EXPECT_EQ(ring.distance(0, 9), 1u);
    BaseManifold line(10);
    EXPECT_EQ(line.distance(0, 9), 9u);
    const SupportRegion s = createWindowSupport(ring, 0, 1);
    EXPECT_EQ(s.activeDimensions(), (std::vector<std::uint32_t>{0, 1, 9}));
    EXPECT_NEAR(s.coverage(), 0.3, 1e-15);
}

TEST(SystemTest, SharedDimensionsAreTheSupportIntersection) {
    const BaseManifold m(4);
    SupportRegion a = createWindowSupport(m, 0, 1);
    SupportRegion b = createWindowSupport(m, 2, 1);
    EXPECT_EQ(sharedDimensions(a, b), (std::vector<std::uint32_t>{1}));
    b.chi[0] = 0.25;
    EXPECT_EQ(sharedDimensions(a, b), (std::vector<std::uint32_t>{0, 1}));
    EXPECT_TRUE(sharedDimensions(createWindowSupport(m, 0, 0), createWindowSupport(m, 3, 0)).empty());
}

TEST(AgentTest, SupportPatterns) {
    std::mt19937_64 rng(3);
    SupportPatternConfig full;
    EXPECT_EQ(createSupport(full, 4, 2, rng).activeDimensions().size(), 4u);

    SupportPatternConfig window;
    window.pattern = SupportPattern::Window;
    window.radius = 1;
    EXPECT_EQ(createSupport(window, 5, 7, rng).activeDimensions(), (std::vector<std::uint32_t>{1, 2, 3}));
    window.periodic = true;
    EXPECT_EQ(createSupport(window, 5, 4, rng).activeDimensions(), (std::vector<std::uint32_t>{0, 3, 4}));

    SupportPatternConfig sparse;
    sparse.pattern = SupportPattern::Random;
    sparse.density = 0.3;
    for (std::uint32_t id = 0; id < 20; ++id) {
        const SupportRegion s = createSupport(sparse, 6, id, rng);
        EXPECT_FALSE(s.activeDimensions().empty());
    }
    sparse.density = 0.0;
    EXPECT_THROW(createSupport(sparse, 6, 0, rng), std::invalid_argument);
}

TEST(AgentTest, SupportPatternKeepsBeliefDraws) {
    AgentConfig full;
    AgentConfig window = full;
    window.support.pattern = SupportPattern::Window;
    window.support.radius = 0;
    const auto a = createAgents(3, full, 21);
    const auto b = createAgents(3, window, 21);
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_TRUE(a[i].muQ == b[i].muQ);
        EXPECT_TRUE(a[i].sigmaQ == b[i].sigmaQ);
        EXPECT_EQ(b[i].support.activeDimensions(), (std::vector<std::uint32_t>{static_cast<std::uint32_t>(i % 3)}));
    }
    // Disjoint single-topic supports never couple
    MultiAgentSystem system(b);
    EXPECT_FALSE(system.coupled(0, 1));
    EXPECT_FALSE(system.partialOverlap(0, 1));
    EXPECT_TRUE(system.sharedDimensions(0, 1).empty());
}

TEST(SystemTest, CommitIsAllOrNothing) {
    MultiAgentSystem system(createAgents(3, AgentConfig{}, 4));
    const Eigen::VectorXd before = system.agent(0).muQ;

    std::vector<Gaussian> next;
    for (const auto& a : system.agents()) next.push_back({(a.muQ.array() + 1.0).matrix(), a.sigmaQ});
    next[2].sigma(1, 1) = -3.0;
    EXPECT_THROW(system.commitBeliefs(next), std::domain_error);
    EXPECT_TRUE(system.agent(0).muQ == before);

    next[2].sigma = system.agent(2).sigmaQ;
    next[1].mu[0] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(system.commitBeliefs(next), std::domain_error);
    EXPECT_TRUE(system.agent(0).muQ == before);
}

TEST(SystemTest, ObservationIsValidated) {
    MultiAgentSystem system(createAgents(2, AgentConfig{}, 4));
    EXPECT_THROW(system.setObservation(0, Observation{Eigen::VectorXd::Zero(2), Eigen::MatrixXd::Identity(2, 2)}),
                 std::invalid_argument);
    EXPECT_THROW(system.setObservation(5, Observation{Eigen::VectorXd::Zero(3), Eigen::MatrixXd::Identity(3, 3)}),
                 std::out_of_range);
    system.setObservation(1, Observation{Eigen::VectorXd::Zero(3), Eigen::MatrixXd::Identity(3, 3)});
    EXPECT_TRUE(system.agent(1).observation.has_value());
    system.clearObservations();
    EXPECT_FALSE(system.agent(1).observation.has_value());
}

TEST(MetricsTest, PolarizationSeparatesCampsFromCrowds) {
    std::vector<Agent> camps;
    std::vector<Agent> crowd;
    for (std::uint32_t i = 0; i < 6; ++i) {
        Agent a;
        a.id = i;
        a.sigmaQ = Eigen::MatrixXd::Identity(2, 2);
        a.muP = Eigen::VectorXd::Zero(2);
        a.sigmaP = Eigen::MatrixXd::Identity(2, 2);
        a.muQ = Eigen::Vector2d(i < 3 ? -2.0 : 2.0, 0.0);
        camps.push_back(a);
        a.muQ = Eigen::Vector2d(0.01 * i, 0.0);
        crowd.push_back(a);
    }
    const SystemMetrics polarized = computeMetrics(MultiAgentSystem(camps));
    const SystemMetrics together = computeMetrics(MultiAgentSystem(crowd));
    EXPECT_GT(polarized.polarization, together.polarization);
    EXPECT_GT(polarized.meanDistance, together.meanDistance);
    EXPECT_GT(polarized.meanPriorKL, together.meanPriorKL);
    EXPECT_GT(polarized.meanInertia, 0.0);

    std::vector<Agent> one(camps.begin(), camps.begin() + 1);
    EXPECT_DOUBLE_EQ(computePolarization(MultiAgentSystem(one)), 0.0);
}

TEST(EventLogTest, CountsByType) {
    EventLog log;
    log.logEnergyIncrease(3, 1.0, 1.5);
    log.logRetractionRepair(4, 2);
    log.logRetractionRepair(5, 1);
    EXPECT_EQ(log.count(EventType::RetractionRepair), 2u);
    EXPECT_EQ(log.count(EventType::Converged), 0u);
    EXPECT_EQ(log.events().front().step, 3u);
    EXPECT_STREQ(eventTypeName(EventType::EnergyDrift), "energy_drift");
    log.clear();
    EXPECT_TRUE(log.events().empty());
}

TEST(EventLogTest, SystemWideEventsCarryTheirReadings) {
    EventLog log;
    log.logEnergyDrift(7, 2.0, 2.25);
    log.logRetractionRepair(8, 3);
    const SimEvent drift = log.events()[0];
    EXPECT_EQ(drift.step, 7u);
    EXPECT_EQ(drift.type, EventType::EnergyDrift);
    EXPECT_DOUBLE_EQ(drift.value, 2.25);
    EXPECT_DOUBLE_EQ(drift.reference, 2.0);
    const SimEvent repair = log.events()[1];
    EXPECT_DOUBLE_EQ(repair.value, 3.0);
    EXPECT_DOUBLE_EQ(repair.reference, 0.0);

    const SimEvent plain{9, EventType::Converged, 1e-9, 0.0};
    EXPECT_EQ(plain.step, 9u);
}
