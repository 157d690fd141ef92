#ifndef GRADIENT_ENGINE_H
#define GRADIENT_ENGINE_H

#include <vector>
#include <Eigen/Dense>
#include "modules/SocialAttention.h"

class MultiAgentSystem;

// Step-scoped gradients of the total free energy for one agent
struct AgentGradients {
    Eigen::VectorXd gradMu;      // dE/dmu_q
    Eigen::MatrixXd gradSigma;   // dE/dSigma_q (symmetric)
    Eigen::VectorXd natGradMu;   // Sigma_q gradMu
    Eigen::MatrixXd natGradSigma;// 2 Sigma_q gradSigma Sigma_q
};

/**
 * Exact Euclidean gradients of computeTotalFreeEnergy().
 *
 * The attention weights depend on the beliefs, so the alignment terms use
 *   w_ij = beta_ij (chi_ij - (chi_ij KL_ij - Ebar_i) / kappa),
 *   Ebar_i = sum_j chi_ij beta_ij KL_ij,
 * and an agent collects both its own row (as the first KL argument) and
 * every row it appears in as a neighbour (second argument). Coupling terms
 * whose lambda is zero are not evaluated at all. A pair that shares only
 * some coordinates contributes nothing on the others; the self and
 * observation terms cover every coordinate.
 *
 * Only reads the snapshot; each agent's gradient is independent.
 */
std::vector<AgentGradients> computeEuclideanGradients(const MultiAgentSystem& system,
                                                      const AttentionField& field);

// Euclidean gradients raised by the inverse Fisher metric at each belief
std::vector<AgentGradients> computeNaturalGradients(const MultiAgentSystem& system,
                                                    const AttentionField& field);
std::vector<AgentGradients> computeNaturalGradients(const MultiAgentSystem& system);

// sqrt(sum_i <grad_i, natGrad_i>): the Fisher norm of the full gradient
double naturalGradientNorm(const std::vector<AgentGradients>& grads);

#endif
