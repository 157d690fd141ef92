#include "modules/GradientEngine.h"
#include "geometry/Spd.h"
#include "kernel/MultiAgentSystem.h"
#include "utils/Parallel.h"
#include "utils/Validation.h"

#include <algorithm>
#include <cmath>

namespace {

// Ebar_i = sum_j chi_ij w_ij kl_ij
Eigen::VectorXd rowExpectation(const Eigen::MatrixXd& coupling,
                               const Eigen::MatrixXd& weights,
                               const Eigen::MatrixXd& kl) {
    return coupling.cwiseProduct(weights).cwiseProduct(kl).rowwise().sum();
}

// dE_i / dKL_ij including the softmax derivative
inline double effectiveWeight(double chi, double w, double kl, double ebar, double kappa) {
    return w * (chi - (chi * kl - ebar) / kappa);
}

}

std::vector<AgentGradients> computeEuclideanGradients(const MultiAgentSystem& system,
                                                      const AttentionField& field) {
    const std::size_t N = system.size();
    const Eigen::Index K = system.dim();
    const SystemConfig& cfg = system.config();
    const Eigen::MatrixXd& chi = system.couplingMatrix();

    const bool beliefCoupling = cfg.lambdaBeliefAlign > 0.0;
    const bool priorCoupling = cfg.lambdaPriorAlign > 0.0;
    const Eigen::VectorXd ebarBelief = beliefCoupling
        ? rowExpectation(chi, field.beta, field.klBelief) : Eigen::VectorXd::Zero(N);
    const Eigen::VectorXd ebarPrior = priorCoupling
        ? rowExpectation(chi, field.gamma, field.klPrior) : Eigen::VectorXd::Zero(N);

    std::vector<AgentGradients> grads(N);
    ParallelErrorSink errors;

    #pragma omp parallel for schedule(dynamic)
    for (std::ptrdiff_t ii = 0; ii < static_cast<std::ptrdiff_t>(N); ++ii) {
        errors.capture([&] {
            const std::size_t i = static_cast<std::size_t>(ii);
            const PrecomputedGaussian& qi = field.beliefs[i];
            Eigen::VectorXd gMu = Eigen::VectorXd::Zero(K);
            Eigen::MatrixXd gSigma = Eigen::MatrixXd::Zero(K, K);

            // Self: KL(q_i || p_i)
            if (cfg.lambdaSelf > 0.0) {
                const KLGradients kg = klGradients(qi, field.priors[i]);
                gMu += cfg.lambdaSelf * kg.dMuQ;
                gSigma += cfg.lambdaSelf * kg.dSigmaQ;
            }

            // Observation: KL(q_i || N(y, R))
            const auto& obs = system.agent(i).observation;
            if (obs) {
                const KLGradients kg = klGradients(qi, precompute(obs->y, obs->covariance));
                gMu += kg.dMuQ;
                gSigma += kg.dSigmaQ;
            }

            if (beliefCoupling) {
                const double lam = cfg.lambdaBeliefAlign;
                const double kappa = cfg.kappaBeta;
                // Row i: q_i is the first argument
                for (std::size_t j = 0; j < N; ++j) {
                    if (!system.coupled(i, j)) continue;
                    const double w = effectiveWeight(chi(i, j), field.beta(i, j), field.klBelief(i, j),
                                                     ebarBelief[i], kappa);
                    if (w == 0.0) continue;
                    const PairwiseKLGradients kg = pairwiseKLGradients(system, i, j, qi, field.beliefs[j]);
                    gMu += lam * w * kg.dMuSelf;
                    gSigma += lam * w * kg.dSigmaSelf;
                }
                // Rows k that attend to i: q_i is the second argument
                for (std::size_t k = 0; k < N; ++k) {
                    if (!system.coupled(k, i)) continue;
                    const double w = effectiveWeight(chi(k, i), field.beta(k, i), field.klBelief(k, i),
                                                     ebarBelief[k], kappa);
                    if (w == 0.0) continue;
                    const PairwiseKLGradients kg = pairwiseKLGradients(system, k, i, field.beliefs[k], qi);
                    gMu += lam * w * kg.dMuOther;
                    gSigma += lam * w * kg.dSigmaOther;
                }
            }

            // Priors are fixed: only the q_i side of KL(q_i || Omega_ij p_j)
            if (priorCoupling) {
                const double lam = cfg.lambdaPriorAlign;
                const double kappa = cfg.kappaGamma;
                for (std::size_t j = 0; j < N; ++j) {
                    if (!system.coupled(i, j)) continue;
                    const double w = effectiveWeight(chi(i, j), field.gamma(i, j), field.klPrior(i, j),
                                                     ebarPrior[i], kappa);
                    if (w == 0.0) continue;
                    const PairwiseKLGradients kg = pairwiseKLGradients(system, i, j, qi, field.priors[j]);
                    gMu += lam * w * kg.dMuSelf;
                    gSigma += lam * w * kg.dSigmaSelf;
                }
            }

            validation::checkFinite(gMu, "mean gradient");
            validation::checkFinite(gSigma, "covariance gradient");
            grads[i].gradMu = std::move(gMu);
            grads[i].gradSigma = symmetrize(gSigma);
        });
    }
    errors.rethrowIfAny();
    return grads;
}

std::vector<AgentGradients> computeNaturalGradients(const MultiAgentSystem& system,
                                                    const AttentionField& field) {
    std::vector<AgentGradients> grads = computeEuclideanGradients(system, field);
    for (std::size_t i = 0; i < grads.size(); ++i) {
        const Eigen::MatrixXd& sigma = field.beliefs[i].sigma;
        grads[i].natGradMu = raiseMeanGradient(sigma, grads[i].gradMu);
        grads[i].natGradSigma = raiseCovarianceGradient(sigma, grads[i].gradSigma);
    }
    return grads;
}

std::vector<AgentGradients> computeNaturalGradients(const MultiAgentSystem& system) {
    return computeNaturalGradients(system, computeAttention(system));
}

double naturalGradientNorm(const std::vector<AgentGradients>& grads) {
    double sq = 0.0;
    for (const auto& g : grads) {
        sq += g.gradMu.dot(g.natGradMu);
        sq += g.gradSigma.cwiseProduct(g.natGradSigma).sum();
    }
    return std::sqrt(std::max(0.0, sq));
}
