#ifndef HAMILTONIAN_TRAINER_H
#define HAMILTONIAN_TRAINER_H

#include <cstddef>
#include <cstdint>
#include <vector>
#include <Eigen/Dense>
#include "kernel/Config.h"
#include "modules/FreeEnergy.h"
#include "utils/EventLog.h"

class MultiAgentSystem;

// Entry t describes the state after step t
struct HamiltonianHistory {
    std::vector<FreeEnergyBreakdown> energy;
    std::vector<double> kinetic;
    std::vector<double> potential;
    std::vector<double> hamiltonian;
    std::vector<std::size_t> repairs;
    double initialHamiltonian = 0.0;

    std::size_t size() const { return energy.size(); }
    // max_t |H_t - H_0| / max(|H_0|, 1e-12)
    double maxRelativeDrift() const;
};

/**
 * Underdamped belief dynamics: leapfrog on (mu, pi) with the epistemic mass
 * M_i, and on (Sigma, V) with the Fisher metric as inertia.
 *
 *   half-kick  pi += dt/2 (-dE/dmu - dT/dmu)
 *              V  += dt/2 (-2 S (dE/dS + dT/dS) S + V S^-1 V)
 *   drift      mu += dt M_i^-1 pi             S <- retract(S + dt V)
 *   half-kick  (forces and mass re-evaluated at the new state)
 *
 * T = sum_i 1/2 pi^T M_i^-1 pi + 1/4 tr(S^-1 V S^-1 V) and H = T + E.
 * dT/d(mu, S) at fixed momenta is the force from the mass depending on the
 * beliefs through the social term; V S^-1 V is the curvature of the Fisher
 * metric on covariances. The drift uses the mass from the start of the step.
 * With the geodesic term disabled the covariance uses the flat metric:
 * T_S = 1/2 tr(V V) and the kick is -dE/dS.
 *
 * With friction 0, H is conserved up to an error that shrinks with dt; a
 * relative drift above driftTolerance is logged once as EnergyDrift. With
 * friction gamma > 0 each half-kick first scales the momenta by
 * exp(-gamma dt/2).
 */
class HamiltonianTrainer {
public:
    explicit HamiltonianTrainer(const MultiAgentSystem& system, const HamiltonianConfig& cfg = {});

    FreeEnergyBreakdown step(MultiAgentSystem& system);
    const HamiltonianHistory& run(MultiAgentSystem& system);
    const HamiltonianHistory& run(MultiAgentSystem& system, int nSteps);

    const std::vector<Eigen::VectorXd>& momenta() const { return momenta_; }
    const std::vector<Eigen::MatrixXd>& covarianceVelocities() const { return sigmaVel_; }
    void setMomentum(std::size_t i, const Eigen::VectorXd& pi);
    void resetMomenta();

    // Kinetic energy of the current momenta under the current mass blocks
    double kineticEnergy(const MultiAgentSystem& system) const;

    const HamiltonianHistory& history() const { return history_; }
    const EventLog& eventLog() const { return event_log_; }
    const HamiltonianConfig& config() const { return cfg_; }
    std::uint64_t stepCount() const { return steps_; }

private:
    void checkShape(const MultiAgentSystem& system) const;
    std::vector<Eigen::MatrixXd> inverseMassBlocks(const MultiAgentSystem& system,
                                                   const AttentionField& field) const;
    void halfKick(const MultiAgentSystem& system, const AttentionField& field,
                  const std::vector<Eigen::MatrixXd>& massInv);
    double kinetic(const MultiAgentSystem& system, const std::vector<Eigen::MatrixXd>& massInv) const;

    HamiltonianConfig cfg_;
    std::size_t N_ = 0;
    std::uint32_t K_ = 0;
    std::vector<Eigen::VectorXd> momenta_;
    std::vector<Eigen::MatrixXd> sigmaVel_;
    HamiltonianHistory history_;
    EventLog event_log_;
    std::uint64_t steps_ = 0;
    bool driftReported_ = false;
};

#endif
