#include "modules/HamiltonianTrainer.h"
#include "geometry/Gaussian.h"
#include "geometry/Spd.h"
#include "kernel/MultiAgentSystem.h"
#include "modules/Geodesic.h"
#include "modules/GradientEngine.h"
#include "modules/MassMatrix.h"
#include "modules/Retraction.h"
#include "modules/SocialAttention.h"
#include "utils/Validation.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

double HamiltonianHistory::maxRelativeDrift() const {
    const double scale = std::max(std::abs(initialHamiltonian), 1e-12);
    double worst = 0.0;
    for (double h : hamiltonian) {
        worst = std::max(worst, std::abs(h - initialHamiltonian) / scale);
    }
    return worst;
}

HamiltonianTrainer::HamiltonianTrainer(const MultiAgentSystem& system, const HamiltonianConfig& cfg)
    : cfg_(cfg), N_(system.size()), K_(system.dim()) {
    cfg_.validate();
    resetMomenta();
}

void HamiltonianTrainer::resetMomenta() {
    const Eigen::Index K = K_;
    momenta_.assign(N_, Eigen::VectorXd::Zero(K));
    sigmaVel_.assign(N_, Eigen::MatrixXd::Zero(K, K));
}

void HamiltonianTrainer::setMomentum(std::size_t i, const Eigen::VectorXd& pi) {
    if (i >= N_) {
        throw std::out_of_range("agent index " + std::to_string(i) + " out of range");
    }
    validation::checkLength(pi, K_, "momentum");
    validation::checkFinite(pi, "momentum");
    momenta_[i] = pi;
}

void HamiltonianTrainer::checkShape(const MultiAgentSystem& system) const {
    if (system.size() != N_ || system.dim() != K_) {
        throw std::invalid_argument("system shape changed since the integrator was created (N=" +
                                    std::to_string(system.size()) + ", K=" + std::to_string(system.dim()) + ")");
    }
}

std::vector<Eigen::MatrixXd> HamiltonianTrainer::inverseMassBlocks(const MultiAgentSystem& system,
                                                                    const AttentionField& field) const {
    const std::vector<Eigen::MatrixXd> mass = buildAgentMassBlocks(system, field.beta, cfg_.mass);
    std::vector<Eigen::MatrixXd> massInv;
    massInv.reserve(mass.size());
    for (const auto& m : mass) massInv.push_back(checkedInverse(m));
    return massInv;
}

void HamiltonianTrainer::halfKick(const MultiAgentSystem& system, const AttentionField& field,
                                  const std::vector<Eigen::MatrixXd>& massInv) {
    const double h = 0.5 * cfg_.dt;
    const double damp = std::exp(-cfg_.friction * h);
    const std::vector<AgentGradients> grads = computeEuclideanGradients(system, field);

    std::vector<Eigen::VectorXd> velocities(N_);
    for (std::size_t i = 0; i < N_; ++i) {
        velocities[i] = massInv[i] * momenta_[i];
    }
    // Force from the mass changing with the beliefs
    const std::vector<AgentGradients> massGrads = computeKineticGradients(system, field, velocities, cfg_.mass);

    for (std::size_t i = 0; i < N_; ++i) {
        momenta_[i] = damp * momenta_[i] - h * (grads[i].gradMu + massGrads[i].gradMu);
        if (cfg_.evolveCovariance) {
            const Eigen::MatrixXd& sigma = field.beliefs[i].sigma;
            const Eigen::MatrixXd g = grads[i].gradSigma + massGrads[i].gradSigma;
            Eigen::MatrixXd accel;
            if (cfg_.geodesic.enabled) {
                accel = geodesicAcceleration(sigma, sigmaVel_[i]) - raiseCovarianceGradient(sigma, g);
            } else {
                accel = -g;
            }
            sigmaVel_[i] = symmetrize(damp * sigmaVel_[i] + h * accel);
        }
        validation::checkFinite(momenta_[i], "momentum");
        validation::checkFinite(sigmaVel_[i], "covariance velocity");
    }
}

double HamiltonianTrainer::kinetic(const MultiAgentSystem& system,
                                   const std::vector<Eigen::MatrixXd>& massInv) const {
    double t = 0.0;
    for (std::size_t i = 0; i < N_; ++i) {
        t += 0.5 * momenta_[i].dot(massInv[i] * momenta_[i]);
        if (!cfg_.evolveCovariance) continue;
        if (cfg_.geodesic.enabled) {
            const Eigen::MatrixXd precision = checkedInverse(system.agent(i).sigmaQ);
            t += 0.5 * fisherCovarianceInner(precision, sigmaVel_[i], sigmaVel_[i]);
        } else {
            t += 0.5 * sigmaVel_[i].squaredNorm();
        }
    }
    return t;
}

double HamiltonianTrainer::kineticEnergy(const MultiAgentSystem& system) const {
    checkShape(system);
    return kinetic(system, inverseMassBlocks(system, computeAttention(system)));
}

FreeEnergyBreakdown HamiltonianTrainer::step(MultiAgentSystem& system) {
    checkShape(system);

    const AttentionField field = computeAttention(system);
    const std::vector<Eigen::MatrixXd> massInv = inverseMassBlocks(system, field);

    if (history_.hamiltonian.empty()) {
        history_.initialHamiltonian = computeTotalFreeEnergy(system, field).total + kinetic(system, massInv);
    }

    halfKick(system, field, massInv);

    // Drift: every proposal is built from the same pre-drift state
    std::vector<Gaussian> proposals(N_);
    std::size_t repaired = 0;
    for (std::size_t i = 0; i < N_; ++i) {
        const Agent& a = system.agent(i);
        proposals[i].mu = a.muQ + cfg_.dt * (massInv[i] * momenta_[i]);
        if (cfg_.evolveCovariance) {
            const Eigen::MatrixXd tangent = cfg_.dt * sigmaVel_[i];
            if (cfg_.retraction != RetractionMode::Exponential && needsRepair(a.sigmaQ + tangent, cfg_.spdEpsilon)) {
                ++repaired;
            }
            proposals[i].sigma = retract(cfg_.retraction, a.sigmaQ, tangent, cfg_.spdEpsilon);
        } else {
            proposals[i].sigma = a.sigmaQ;
        }
    }
    system.commitBeliefs(proposals);

    // Second kick and the reported H use the mass at the new beliefs
    const AttentionField next = computeAttention(system);
    const std::vector<Eigen::MatrixXd> nextMassInv = inverseMassBlocks(system, next);
    halfKick(system, next, nextMassInv);

    const FreeEnergyBreakdown energy = computeTotalFreeEnergy(system, next);
    const double t = kinetic(system, nextMassInv);
    const double h = t + energy.total;

    history_.energy.push_back(energy);
    history_.kinetic.push_back(t);
    history_.potential.push_back(energy.total);
    history_.hamiltonian.push_back(h);
    history_.repairs.push_back(repaired);

    if (repaired > 0) {
        event_log_.logRetractionRepair(steps_, repaired);
    }
    const double scale = std::max(std::abs(history_.initialHamiltonian), 1e-12);
    if (!driftReported_ && cfg_.friction == 0.0 &&
        std::abs(h - history_.initialHamiltonian) / scale > cfg_.driftTolerance) {
        event_log_.logEnergyDrift(steps_, history_.initialHamiltonian, h);
        driftReported_ = true;
    }
    ++steps_;
    return energy;
}

const HamiltonianHistory& HamiltonianTrainer::run(MultiAgentSystem& system) {
    return run(system, cfg_.nSteps);
}

const HamiltonianHistory& HamiltonianTrainer::run(MultiAgentSystem& system, int nSteps) {
    if (nSteps < 0) {
        throw std::invalid_argument("nSteps must be >= 0 (got " + std::to_string(nSteps) + ")");
    }
    for (int t = 0; t < nSteps; ++t) {
        step(system);
    }
    return history_;
}
