#include "modules/SocialAttention.h"
#include "geometry/Spd.h"
#include "kernel/MultiAgentSystem.h"
#include "utils/Parallel.h"
#include "utils/Validation.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {

// Restrictions of q_i and t_j to the shared coordinates of frame i
struct SharedPair {
    Eigen::MatrixXd select;   // P
    Eigen::MatrixXd map;      // A = P Omega_ij
    PrecomputedGaussian q;
    PrecomputedGaussian t;
};

SharedPair restrictPair(const MultiAgentSystem& system, std::size_t i, std::size_t j,
                        const PrecomputedGaussian& qi, const PrecomputedGaussian& tj) {
    SharedPair out;
    out.select = coordinateSelection(system.sharedDimensions(i, j), system.dim());
    out.map = out.select * system.transport(i, j);
    out.q = precompute(transportGaussian(Gaussian{qi.mu, qi.sigma}, out.select));
    out.t = precompute(transportGaussian(Gaussian{tj.mu, tj.sigma}, out.map));
    return out;
}

}  // namespace

double pairwiseKL(const MultiAgentSystem& system, std::size_t i, std::size_t j,
                  const PrecomputedGaussian& qi, const PrecomputedGaussian& tj) {
    if (!system.partialOverlap(i, j)) {
        return klGaussian(qi, transportGaussian(tj, system.transport(i, j)));
    }
    const SharedPair pair = restrictPair(system, i, j, qi, tj);
    return klGaussian(pair.q, pair.t);
}

PairwiseKLGradients pairwiseKLGradients(const MultiAgentSystem& system, std::size_t i, std::size_t j,
                                        const PrecomputedGaussian& qi, const PrecomputedGaussian& tj) {
    PairwiseKLGradients out;
    if (!system.partialOverlap(i, j)) {
        const Eigen::MatrixXd& omega = system.transport(i, j);
        const KLGradients kg = klGradients(qi, transportGaussian(tj, omega));
        out.dMuSelf = kg.dMuQ;
        out.dSigmaSelf = kg.dSigmaQ;
        out.dMuOther = omega.transpose() * kg.dMuP;
        out.dSigmaOther = symmetrize(omega.transpose() * kg.dSigmaP * omega);
        return out;
    }
    // Coordinates outside S receive no gradient from this pair
    const SharedPair pair = restrictPair(system, i, j, qi, tj);
    const KLGradients kg = klGradients(pair.q, pair.t);
    out.dMuSelf = pair.select.transpose() * kg.dMuQ;
    out.dSigmaSelf = symmetrize(pair.select.transpose() * kg.dSigmaQ * pair.select);
    out.dMuOther = pair.map.transpose() * kg.dMuP;
    out.dSigmaOther = symmetrize(pair.map.transpose() * kg.dSigmaP * pair.map);
    return out;
}

Eigen::VectorXd softmaxNumericallyStable(const Eigen::VectorXd& logits, const std::vector<bool>& mask) {
    const Eigen::Index n = logits.size();
    if (static_cast<Eigen::Index>(mask.size()) != n) {
        throw std::invalid_argument("softmax mask size mismatch");
    }
    Eigen::VectorXd out = Eigen::VectorXd::Zero(n);

    double maxLogit = -std::numeric_limits<double>::infinity();
    for (Eigen::Index j = 0; j < n; ++j) {
        if (!mask[j]) continue;
        validation::checkFinite(logits[j], "softmax logit");
        maxLogit = std::max(maxLogit, logits[j]);
    }
    if (!std::isfinite(maxLogit)) {
        return out;  // nothing to attend to
    }

    double z = 0.0;
    for (Eigen::Index j = 0; j < n; ++j) {
        if (!mask[j]) continue;
        out[j] = std::exp(logits[j] - maxLogit);
        z += out[j];
    }
    // z >= 1: the arg-max entry contributes exp(0)
    out /= z;
    return out;
}

Eigen::MatrixXd computeKLMatrix(const MultiAgentSystem& system, KLMode mode,
                                const std::vector<PrecomputedGaussian>& beliefs,
                                const std::vector<PrecomputedGaussian>& priors) {
    const std::size_t N = system.size();
    const auto& targets = (mode == KLMode::Belief) ? beliefs : priors;
    Eigen::MatrixXd kl = Eigen::MatrixXd::Zero(N, N);
    ParallelErrorSink errors;

    // Rows are independent: row i only reads the snapshot
    #pragma omp parallel for schedule(static)
    for (std::ptrdiff_t ii = 0; ii < static_cast<std::ptrdiff_t>(N); ++ii) {
        errors.capture([&] {
            const std::size_t i = static_cast<std::size_t>(ii);
            for (std::size_t j = 0; j < N; ++j) {
                if (i == j) continue;
                kl(i, j) = pairwiseKL(system, i, j, beliefs[i], targets[j]);
            }
        });
    }
    errors.rethrowIfAny();
    return kl;
}

Eigen::MatrixXd computeKLMatrix(const MultiAgentSystem& system, KLMode mode) {
    const auto beliefs = system.precomputeBeliefs();
    const auto priors = system.precomputePriors();
    return computeKLMatrix(system, mode, beliefs, priors);
}

Eigen::MatrixXd computeSoftmaxWeights(const Eigen::MatrixXd& kl, double kappa,
                                      const Eigen::MatrixXd& coupling) {
    validation::checkPositive(kappa, "softmax temperature");
    if (kl.rows() != coupling.rows() || kl.cols() != coupling.cols()) {
        throw std::invalid_argument("KL and coupling matrices differ in shape");
    }
    const Eigen::Index N = kl.rows();
    Eigen::MatrixXd weights = Eigen::MatrixXd::Zero(N, kl.cols());
    std::vector<bool> mask(static_cast<std::size_t>(kl.cols()));
    for (Eigen::Index i = 0; i < N; ++i) {
        for (Eigen::Index j = 0; j < kl.cols(); ++j) {
            mask[j] = (i != j) && coupling(i, j) > 0.0;
        }
        const Eigen::VectorXd logits = -kl.row(i).transpose() / kappa;
        weights.row(i) = softmaxNumericallyStable(logits, mask).transpose();
    }
    return weights;
}

Eigen::MatrixXd computeSocialInfluenceMatrix(const MultiAgentSystem& system) {
    const Eigen::MatrixXd kl = computeKLMatrix(system, KLMode::Belief);
    return computeSoftmaxWeights(kl, system.config().kappaBeta, system.couplingMatrix());
}

AttentionField computeAttention(const MultiAgentSystem& system) {
    AttentionField field;
    field.beliefs = system.precomputeBeliefs();
    field.priors = system.precomputePriors();
    field.klBelief = computeKLMatrix(system, KLMode::Belief, field.beliefs, field.priors);
    field.klPrior = computeKLMatrix(system, KLMode::Prior, field.beliefs, field.priors);
    field.beta = computeSoftmaxWeights(field.klBelief, system.config().kappaBeta, system.couplingMatrix());
    field.gamma = computeSoftmaxWeights(field.klPrior, system.config().kappaGamma, system.couplingMatrix());
    return field;
}
