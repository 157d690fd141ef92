#ifndef SOCIAL_ATTENTION_H
#define SOCIAL_ATTENTION_H

#include <cstddef>
#include <cstdint>
#include <vector>
#include <Eigen/Dense>
#include "geometry/Gaussian.h"

class MultiAgentSystem;

enum class KLMode : std::uint8_t {
    Belief = 0,  // KL(q_i || Omega_ij q_j)
    Prior = 1    // KL(q_i || Omega_ij p_j)
};

/**
 * One consistent view of social attention for a step.
 *
 * beta_ij = softmax_j(-KL_ij / kappa) over the agents coupled to i.
 * Lower KL (closer neighbour) -> higher attention. Rows with at least one
 * neighbour sum to 1; the diagonal and uncoupled entries are 0.
 */
struct AttentionField {
    std::vector<PrecomputedGaussian> beliefs;  // snapshot the matrices were built from
    std::vector<PrecomputedGaussian> priors;
    Eigen::MatrixXd klBelief;
    Eigen::MatrixXd beta;
    Eigen::MatrixXd klPrior;
    Eigen::MatrixXd gamma;
};

/**
 * Comparison of agent i with a neighbour Gaussian t_j (given in frame j),
 * evaluated in frame i over the coordinates both agents support:
 *   KL(P q_i || A t_j),  P = rows S of I,  A = rows S of Omega_ij,
 * S = sharedDimensions(i, j). With every coordinate shared this is
 * KL(q_i || Omega_ij t_j).
 */
double pairwiseKL(const MultiAgentSystem& system, std::size_t i, std::size_t j,
                  const PrecomputedGaussian& qi, const PrecomputedGaussian& tj);

// Gradients of pairwiseKL() with respect to q_i and to t_j in its own frame
struct PairwiseKLGradients {
    Eigen::VectorXd dMuSelf;
    Eigen::MatrixXd dSigmaSelf;
    Eigen::VectorXd dMuOther;
    Eigen::MatrixXd dSigmaOther;
};

PairwiseKLGradients pairwiseKLGradients(const MultiAgentSystem& system, std::size_t i, std::size_t j,
                                        const PrecomputedGaussian& qi, const PrecomputedGaussian& tj);

// Masked softmax with max subtraction. Entries with mask == false are 0;
// an all-false mask yields the zero vector.
Eigen::VectorXd softmaxNumericallyStable(const Eigen::VectorXd& logits, const std::vector<bool>& mask);

// Entry (i, j) is pairwiseKL() of q_i against q_j or p_j
Eigen::MatrixXd computeKLMatrix(const MultiAgentSystem& system, KLMode mode);
Eigen::MatrixXd computeKLMatrix(const MultiAgentSystem& system, KLMode mode,
                                const std::vector<PrecomputedGaussian>& beliefs,
                                const std::vector<PrecomputedGaussian>& priors);

// Row-wise softmax of -kl/kappa restricted to coupling(i, j) > 0.
// Throws std::domain_error for kappa <= 0 or non-finite.
Eigen::MatrixXd computeSoftmaxWeights(const Eigen::MatrixXd& kl, double kappa,
                                      const Eigen::MatrixXd& coupling);

// beta for the current beliefs at the configured kappaBeta
Eigen::MatrixXd computeSocialInfluenceMatrix(const MultiAgentSystem& system);

AttentionField computeAttention(const MultiAgentSystem& system);

#endif
