#include "modules/MassMatrix.h"
#include "geometry/Gaussian.h"
#include "geometry/Spd.h"
#include "kernel/MultiAgentSystem.h"
#include "modules/SocialAttention.h"
#include "utils/Validation.h"

#include <stdexcept>
#include <string>

namespace {

// Precision of Omega_ij q_j seen by i, lifted back to K coordinates:
// A^T (A Sigma_j A^T)^-1 A with A the shared rows of Omega_ij.
Eigen::MatrixXd neighbourPrecision(const MultiAgentSystem& system, std::size_t i, std::size_t j,
                                   const Eigen::MatrixXd& precisionJ) {
    if (!system.partialOverlap(i, j)) {
        const Eigen::MatrixXd& omega = system.transport(i, j);
        return omega * precisionJ * omega.transpose();
    }
    const Eigen::MatrixXd a = system.sharedTransport(i, j);
    const Eigen::MatrixXd c = symmetrize(a * system.agent(j).sigmaQ * a.transpose());
    return a.transpose() * checkedInverse(c) * a;
}

}  // namespace

std::vector<Eigen::MatrixXd> buildAgentMassBlocks(const MultiAgentSystem& system,
                                                  const Eigen::MatrixXd& beta,
                                                  const MassMatrixConfig& cfg) {
    cfg.validate();
    const std::size_t N = system.size();
    const Eigen::Index K = system.dim();
    const double lam = system.config().lambdaBeliefAlign;

    std::vector<Eigen::MatrixXd> beliefPrecision;
    if (cfg.includeSocial && lam > 0.0) {
        beliefPrecision.reserve(N);
        for (const auto& a : system.agents()) {
            beliefPrecision.push_back(checkedInverse(a.sigmaQ));
        }
    }

    std::vector<Eigen::MatrixXd> blocks(N);
    for (std::size_t i = 0; i < N; ++i) {
        const Agent& a = system.agent(i);
        Eigen::MatrixXd m = cfg.regularization * Eigen::MatrixXd::Identity(K, K);
        if (cfg.includePrior) {
            m += checkedInverse(a.sigmaP);
        }
        if (cfg.includeObservation && a.observation) {
            m += checkedInverse(a.observation->covariance);
        }
        if (!beliefPrecision.empty()) {
            for (std::size_t j = 0; j < N; ++j) {
                if (!system.coupled(i, j)) continue;
                const double w = lam * system.couplingMatrix()(i, j) * beta(i, j);
                if (w == 0.0) continue;
                m += w * neighbourPrecision(system, i, j, beliefPrecision[j]);
            }
        }
        m = symmetrize(m);
        if (!isSPD(m)) {
            throw std::domain_error("mass block of agent " + std::to_string(i) + " is not SPD");
        }
        blocks[i] = std::move(m);
    }
    return blocks;
}

Eigen::MatrixXd buildMuMassMatrix(const MultiAgentSystem& system, const MassMatrixConfig& cfg) {
    const Eigen::MatrixXd beta = computeSocialInfluenceMatrix(system);
    const auto blocks = buildAgentMassBlocks(system, beta, cfg);
    const Eigen::Index K = system.dim();
    const Eigen::Index N = static_cast<Eigen::Index>(system.size());
    Eigen::MatrixXd M = Eigen::MatrixXd::Zero(N * K, N * K);
    for (Eigen::Index i = 0; i < N; ++i) {
        M.block(i * K, i * K, K, K) = blocks[static_cast<std::size_t>(i)];
    }
    return M;
}

Eigen::MatrixXd buildFullMassMatrix(const MultiAgentSystem& system, const MassMatrixConfig& cfg) {
    const Eigen::MatrixXd beta = computeSocialInfluenceMatrix(system);
    const auto blocks = buildAgentMassBlocks(system, beta, cfg);
    const Eigen::Index K = system.dim();
    const Eigen::Index D = K + K * K;
    const Eigen::Index N = static_cast<Eigen::Index>(system.size());
    Eigen::MatrixXd M = Eigen::MatrixXd::Zero(N * D, N * D);
    for (Eigen::Index i = 0; i < N; ++i) {
        const Agent& a = system.agent(static_cast<std::size_t>(i));
        const Eigen::MatrixXd fisher = fisherMatrix(a.belief());
        M.block(i * D, i * D, K, K) = blocks[static_cast<std::size_t>(i)];
        M.block(i * D + K, i * D + K, K * K, K * K) = fisher.bottomRightCorner(K * K, K * K);
    }
    return M;
}

Eigen::VectorXd computeEpistemicInertia(const MultiAgentSystem& system, const MassMatrixConfig& cfg) {
    const Eigen::MatrixXd beta = computeSocialInfluenceMatrix(system);
    const auto blocks = buildAgentMassBlocks(system, beta, cfg);
    Eigen::VectorXd inertia(static_cast<Eigen::Index>(blocks.size()));
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        inertia[static_cast<Eigen::Index>(i)] = blocks[i].trace() / static_cast<double>(system.dim());
    }
    return inertia;
}

std::vector<AgentGradients> computeKineticGradients(const MultiAgentSystem& system,
                                                   const AttentionField& field,
                                                   const std::vector<Eigen::VectorXd>& velocities,
                                                   const MassMatrixConfig& cfg) {
    cfg.validate();
    const std::size_t N = system.size();
    const Eigen::Index K = system.dim();
    if (velocities.size() != N) {
        throw std::invalid_argument("kinetic gradients: expected " + std::to_string(N) +
                                    " velocities, got " + std::to_string(velocities.size()));
    }
    std::vector<AgentGradients> grads(N);
    for (auto& g : grads) {
        g.gradMu = Eigen::VectorXd::Zero(K);
        g.gradSigma = Eigen::MatrixXd::Zero(K, K);
    }
    const double lam = system.config().lambdaBeliefAlign;
    if (!cfg.includeSocial || lam == 0.0) {
        return grads;
    }
    const double kappa = system.config().kappaBeta;
    const Eigen::MatrixXd& chi = system.couplingMatrix();

    // dT_i = -1/2 v_i^T dM_i v_i with M_i's social part lam sum_j chi_ij beta_ij H_ij,
    // H_ij = A^T C^-1 A, C = A Sigma_j A^T. With s_ij = v_i^T H_ij v_i:
    //   through beta: lam/(2 kappa) beta_ij (chi_ij s_ij - sbar_i) dKL_ij
    //   through C:    dT/dSigma_j = lam/2 chi_ij beta_ij A^T z z^T A,  z = C^-1 A v_i
    std::vector<Eigen::MatrixXd> maps(N);
    std::vector<Eigen::VectorXd> zs(N);
    Eigen::VectorXd s = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(N));
    for (std::size_t i = 0; i < N; ++i) {
        validation::checkLength(velocities[i], K, "velocity");
        double sbar = 0.0;
        for (std::size_t j = 0; j < N; ++j) {
            s[j] = 0.0;
            if (!system.coupled(i, j) || field.beta(i, j) == 0.0) continue;
            maps[j] = system.sharedTransport(i, j);
            const Eigen::MatrixXd c = symmetrize(maps[j] * field.beliefs[j].sigma * maps[j].transpose());
            const Eigen::VectorXd y = maps[j] * velocities[i];
            zs[j] = checkedInverse(c) * y;
            s[j] = y.dot(zs[j]);
            sbar += field.beta(i, j) * chi(i, j) * s[j];
        }
        for (std::size_t j = 0; j < N; ++j) {
            if (!system.coupled(i, j) || field.beta(i, j) == 0.0) continue;
            const double beta = field.beta(i, j);
            const double w = 0.5 * lam / kappa * beta * (chi(i, j) * s[j] - sbar);
            if (w != 0.0) {
                const PairwiseKLGradients kg =
                    pairwiseKLGradients(system, i, j, field.beliefs[i], field.beliefs[j]);
                grads[i].gradMu += w * kg.dMuSelf;
                grads[i].gradSigma += w * kg.dSigmaSelf;
                grads[j].gradMu += w * kg.dMuOther;
                grads[j].gradSigma += w * kg.dSigmaOther;
            }
            const Eigen::VectorXd az = maps[j].transpose() * zs[j];
            grads[j].gradSigma += (0.5 * lam * chi(i, j) * beta) * az * az.transpose();
        }
    }
    for (auto& g : grads) {
        g.gradSigma = symmetrize(g.gradSigma);
        validation::checkFinite(g.gradMu, "kinetic mean gradient");
        validation::checkFinite(g.gradSigma, "kinetic covariance gradient");
    }
    return grads;
}
