#include <gtest/gtest.h>
#include "kernel/MultiAgentSystem.h"
#include "modules/FreeEnergy.h"
#include "modules/GradientEngine.h"
#include "geometry/Spd.h"

#include <algorithm>
#include <cmath>

namespace {

std::vector<Gaussian> currentBeliefs(const MultiAgentSystem& system) {
    std::vector<Gaussian> out;
    for (const auto& a : system.agents()) out.push_back(a.belief());
    return out;
}

double energyWith(const MultiAgentSystem& system, const std::vector<Gaussian>& beliefs) {
    MultiAgentSystem copy = system;
    copy.commitBeliefs(beliefs);
    return computeTotalFreeEnergy(copy).total;
}

MultiAgentSystem randomSystem(const SystemConfig& cfg, double gaugeScale = 0.6) {
    AgentConfig ac;
    ac.K = 3;
    ac.muScale = 0.8;
    ac.sigmaScale = 0.7;
    ac.gaugeScale = gaugeScale;
    return MultiAgentSystem(createAgents(5, ac, 7), cfg);
}

}  // namespace

TEST(FreeEnergyTest, TermsAreNonNegative) {
    SystemConfig cfg;
    cfg.lambdaPriorAlign = 0.5;
    auto system = randomSystem(cfg);
    const FreeEnergyBreakdown e = computeTotalFreeEnergy(system);
    EXPECT_GE(e.self, 0.0);
    EXPECT_GE(e.beliefAlign, 0.0);
    EXPECT_GE(e.priorAlign, 0.0);
    EXPECT_GE(e.observation, 0.0);
    EXPECT_NEAR(e.total, cfg.lambdaSelf * e.self + cfg.lambdaBeliefAlign * e.beliefAlign +
                         cfg.lambdaPriorAlign * e.priorAlign + e.observation, 1e-12);
}

TEST(FreeEnergyTest, ZeroWhenEveryoneAgreesWithTheirPrior) {
    std::vector<Agent> agents;
    for (std::uint32_t i = 0; i < 4; ++i) {
        Agent a;
        a.id = i;
        a.muQ = Eigen::Vector3d(0.2, -0.1, 0.4);
        a.sigmaQ = 0.6 * Eigen::MatrixXd::Identity(3, 3);
        a.muP = a.muQ;
        a.sigmaP = a.sigmaQ;
        agents.push_back(a);
    }
    SystemConfig cfg;
    cfg.lambdaPriorAlign = 1.0;
    MultiAgentSystem system(std::move(agents), cfg);
    const FreeEnergyBreakdown e = computeTotalFreeEnergy(system);
    EXPECT_NEAR(e.total, 0.0, 1e-12);
}

TEST(FreeEnergyTest, LambdaScalesOnlyItsTerm) {
    SystemConfig a;
    SystemConfig b;
    b.lambdaBeliefAlign = 3.0;
    const FreeEnergyBreakdown ea = computeTotalFreeEnergy(randomSystem(a));
    const FreeEnergyBreakdown eb = computeTotalFreeEnergy(randomSystem(b));
    EXPECT_NEAR(ea.beliefAlign, eb.beliefAlign, 1e-12);
    EXPECT_NEAR(eb.total - ea.total, 2.0 * ea.beliefAlign, 1e-10);
}

TEST(FreeEnergyTest, ObservationTermFollowsEvidence) {
    auto system = randomSystem(SystemConfig{});
    const double base = computeTotalFreeEnergy(system).total;
    EXPECT_DOUBLE_EQ(computeTotalFreeEnergy(system).observation, 0.0);

    system.setObservation(2, Observation{Eigen::Vector3d(3.0, 3.0, 3.0), 0.1 * Eigen::MatrixXd::Identity(3, 3)});
    const FreeEnergyBreakdown withObs = computeTotalFreeEnergy(system);
    EXPECT_GT(withObs.observation, 0.0);
    EXPECT_NEAR(withObs.total, base + withObs.observation, 1e-10);

    system.clearObservation(2);
    EXPECT_NEAR(computeTotalFreeEnergy(system).total, base, 1e-12);
}

TEST(FreeEnergyTest, IsolatedAgentsOnlyPayTheSelfTerm) {
    AgentConfig ac;
    CouplingConfig cc;
    cc.topology = CouplingTopology::Isolated;
    MultiAgentSystem system(createAgents(4, ac, 3), SystemConfig{}, cc);
    const FreeEnergyBreakdown e = computeTotalFreeEnergy(system);
    EXPECT_DOUBLE_EQ(e.beliefAlign, 0.0);
    double expected = 0.0;
    for (const auto& a : system.agents()) expected += klGaussian(a.belief(), a.prior());
    EXPECT_NEAR(e.total, expected, 1e-12);
}

namespace {

// Windows of radius 1 around id mod 3: pairs share one, two or all three
// coordinates.
MultiAgentSystem windowSystem(const SystemConfig& cfg) {
    AgentConfig ac;
    ac.K = 3;
    ac.muScale = 0.8;
    ac.sigmaScale = 0.7;
    ac.gaugeScale = 0.6;
    ac.support.pattern = SupportPattern::Window;
    ac.support.radius = 1;
    return MultiAgentSystem(createAgents(5, ac, 7), cfg);
}

// Central differences of the full energy against the analytic gradient
void expectGradientMatchesEnergy(const MultiAgentSystem& system) {
    const auto grads = computeEuclideanGradients(system, computeAttention(system));
    const double h = 1e-5;

    for (std::size_t i : {0u, 1u, 2u, 4u}) {
        for (Eigen::Index k = 0; k < 3; ++k) {
            auto up = currentBeliefs(system);
            auto dn = up;
            up[i].mu[k] += h;
            dn[i].mu[k] -= h;
            const double fd = (energyWith(system, up) - energyWith(system, dn)) / (2.0 * h);
            EXPECT_NEAR(grads[i].gradMu[k], fd, 1e-6 * std::max(1.0, std::abs(fd)))
                << "agent " << i << " mean component " << k;
        }

        // Off-diagonal covariance entry, perturbed symmetrically
        Eigen::MatrixXd e = Eigen::MatrixXd::Zero(3, 3);
        e(0, 2) = e(2, 0) = 1.0;
        auto up = currentBeliefs(system);
        auto dn = up;
        up[i].sigma += h * e;
        dn[i].sigma -= h * e;
        const double fd = (energyWith(system, up) - energyWith(system, dn)) / (2.0 * h);
        EXPECT_NEAR(2.0 * grads[i].gradSigma(0, 2), fd, 1e-6 * std::max(1.0, std::abs(fd)))
            << "agent " << i << " covariance";

        Eigen::MatrixXd d = Eigen::MatrixXd::Zero(3, 3);
        d(1, 1) = 1.0;
        up = currentBeliefs(system);
        dn = up;
        up[i].sigma += h * d;
        dn[i].sigma -= h * d;
        const double fdDiag = (energyWith(system, up) - energyWith(system, dn)) / (2.0 * h);
        EXPECT_NEAR(grads[i].gradSigma(1, 1), fdDiag, 1e-6 * std::max(1.0, std::abs(fdDiag)));
    }
}

SystemConfig mixedCoupling() {
    SystemConfig cfg;
    cfg.lambdaBeliefAlign = 0.8;
    cfg.lambdaPriorAlign = 0.4;
    cfg.kappaBeta = 0.7;
    cfg.kappaGamma = 1.3;
    return cfg;
}

// Agent 0 holds an opinion on coordinate 0 only; agent 1 on all three.
// Shared frame, so the comparison is on coordinate 0 alone.
MultiAgentSystem narrowAndBroad(double lambdaSelf) {
    const BaseManifold m(3);
    std::vector<Agent> agents(2);
    for (std::uint32_t i = 0; i < 2; ++i) {
        agents[i].id = i;
        agents[i].muQ = Eigen::Vector3d(0.3 * i, -0.2, 0.5 - i);
        agents[i].sigmaQ = (0.5 + 0.2 * i) * Eigen::MatrixXd::Identity(3, 3);
        agents[i].sigmaQ(1, 2) = agents[i].sigmaQ(2, 1) = 0.1;
        agents[i].muP = Eigen::VectorXd::Zero(3);
        agents[i].sigmaP = Eigen::MatrixXd::Identity(3, 3);
    }
    agents[0].support = createWindowSupport(m, 0, 0);
    agents[1].support = createFullSupport(m);
    SystemConfig cfg;
    cfg.lambdaSelf = lambdaSelf;
    return MultiAgentSystem(std::move(agents), cfg);
}

}  // namespace

// The analytic gradient includes the attention-weight derivative; check it
// against central differences of the full energy, gauge frames included.
TEST(FreeEnergyTest, GradientMatchesFiniteDifferences) {
    auto system = randomSystem(mixedCoupling());
    system.setObservation(1, Observation{Eigen::Vector3d(0.5, -0.5, 0.2), 0.3 * Eigen::MatrixXd::Identity(3, 3)});
    expectGradientMatchesEnergy(system);
}

TEST(FreeEnergyTest, GradientMatchesFiniteDifferencesOnPartialSupports) {
    auto system = windowSystem(mixedCoupling());
    ASSERT_TRUE(system.partialOverlap(0, 2));
    ASSERT_EQ(system.sharedDimensions(0, 2), (std::vector<std::uint32_t>{1}));
    expectGradientMatchesEnergy(system);
}

TEST(FreeEnergyTest, OffSupportCoordinatesDoNotEnterTheComparison) {
    auto system = narrowAndBroad(1.0);
    ASSERT_EQ(system.sharedDimensions(0, 1), (std::vector<std::uint32_t>{0}));
    const double before = computeTotalFreeEnergy(system).beliefAlign;

    // Move agent 1 on coordinates agent 0 has no opinion about
    auto moved = currentBeliefs(system);
    moved[1].mu[1] += 2.0;
    moved[1].mu[2] -= 1.5;
    moved[1].sigma(2, 2) += 0.8;
    MultiAgentSystem offSupport = system;
    offSupport.commitBeliefs(moved);
    EXPECT_NEAR(computeTotalFreeEnergy(offSupport).beliefAlign, before, 1e-12);

    // The shared coordinate still counts
    moved = currentBeliefs(system);
    moved[1].mu[0] += 1.0;
    MultiAgentSystem onSupport = system;
    onSupport.commitBeliefs(moved);
    EXPECT_GT(computeTotalFreeEnergy(onSupport).beliefAlign, before + 0.1);
}

TEST(FreeEnergyTest, SocialGradientStaysOnSharedCoordinates) {
    auto system = narrowAndBroad(0.0);
    const auto grads = computeEuclideanGradients(system, computeAttention(system));
    for (std::size_t i = 0; i < 2; ++i) {
        EXPECT_NE(grads[i].gradMu[0], 0.0);
        EXPECT_EQ(grads[i].gradMu[1], 0.0);
        EXPECT_EQ(grads[i].gradMu[2], 0.0);
        EXPECT_TRUE(grads[i].gradSigma.bottomRightCorner(2, 2).isZero(0.0));
        EXPECT_EQ(grads[i].gradSigma(0, 1), 0.0);
    }
}

TEST(FreeEnergyTest, ZeroCouplingSkipsSocialGradient) {
    SystemConfig cfg;
    cfg.lambdaBeliefAlign = 0.0;
    auto system = randomSystem(cfg);
    const auto grads = computeEuclideanGradients(system, computeAttention(system));
    for (std::size_t i = 0; i < system.size(); ++i) {
        const Agent& a = system.agent(i);
        const Eigen::VectorXd selfOnly = checkedInverse(a.sigmaP) * (a.muQ - a.muP);
        EXPECT_TRUE(grads[i].gradMu.isApprox(selfOnly, 1e-12));
    }
}
