#ifndef MASS_MATRIX_H
#define MASS_MATRIX_H

#include <vector>
#include <Eigen/Dense>
#include "kernel/Config.h"
#include "modules/GradientEngine.h"

class MultiAgentSystem;

/**
 * Epistemic inertia: resistance of each agent's belief mean to change.
 *
 *   M_i = Sigma_p_i^-1                                   (prior precision)
 *       + R_i^-1                                         (observation precision)
 *       + lambdaBeliefAlign * sum_j chi_ij beta_ij Omega_ij Sigma_q_j^-1 Omega_ij^T
 *       + regularization * I
 *
 * For a pair sharing only some coordinates the social term is the precision
 * of the neighbour's marginal on those coordinates, zero elsewhere.
 *
 * Every term is SPD or PSD, so M_i is SPD whenever any precision term or the
 * regularizer is nonzero. Blocks are verified by Cholesky.
 */
std::vector<Eigen::MatrixXd> buildAgentMassBlocks(const MultiAgentSystem& system,
                                                  const Eigen::MatrixXd& beta,
                                                  const MassMatrixConfig& cfg = {});

// NK x NK block diagonal of M_i
Eigen::MatrixXd buildMuMassMatrix(const MultiAgentSystem& system, const MassMatrixConfig& cfg = {});

// N(K + K^2) block diagonal; agent block = blockdiag(M_i, 1/2 Sigma_q^-1 (x) Sigma_q^-1).
// The covariance part is the Fisher inertia the Hamiltonian integrator uses.
Eigen::MatrixXd buildFullMassMatrix(const MultiAgentSystem& system, const MassMatrixConfig& cfg = {});

// trace(M_i) / K per agent (average eigenvalue of the block)
Eigen::VectorXd computeEpistemicInertia(const MultiAgentSystem& system, const MassMatrixConfig& cfg = {});

// Gradient of sum_i 1/2 pi_i^T M_i^-1 pi_i with respect to every belief at
// fixed momenta, given v_i = M_i^-1 pi_i. The mass depends on the beliefs
// only through the social term (attention and neighbour covariances), so
// the result is zero without it. Only gradMu / gradSigma are filled.
std::vector<AgentGradients> computeKineticGradients(const MultiAgentSystem& system,
                                                   const AttentionField& field,
                                                   const std::vector<Eigen::VectorXd>& velocities,
                                                   const MassMatrixConfig& cfg = {});

#endif
