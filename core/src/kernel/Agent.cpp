#include "kernel/Agent.h"
#include "geometry/Spd.h"
#include "utils/Validation.h"

#include <stdexcept>
#include <string>

SupportRegion createSupport(const SupportPatternConfig& cfg, std::uint32_t K,
                            std::uint32_t id, std::mt19937_64& rng) {
    cfg.validate();
    const BaseManifold manifold(K, cfg.periodic ? TopologyType::Periodic : TopologyType::Flat);
    switch (cfg.pattern) {
        case SupportPattern::Full:
            break;
        case SupportPattern::Window:
            return createWindowSupport(manifold, id % K, cfg.radius);
        case SupportPattern::Random: {
            std::uniform_real_distribution<double> uni(0.0, 1.0);
            SupportRegion s;
            s.chi.assign(K, 0.0);
            bool any = false;
            for (std::uint32_t c = 0; c < K; ++c) {
                if (uni(rng) < cfg.density) {
                    s.chi[c] = 1.0;
                    any = true;
                }
            }
            // Every agent holds at least one opinion
            if (!any) s.chi[id % K] = 1.0;
            return s;
        }
    }
    return createFullSupport(manifold);
}

Agent createAgent(std::uint32_t id, const AgentConfig& cfg, std::mt19937_64& rng) {
    cfg.validate();
    const Eigen::Index K = cfg.K;
    std::normal_distribution<double> normal(0.0, 1.0);

    Agent a;
    a.id = id;

    a.muQ.resize(K);
    for (Eigen::Index k = 0; k < K; ++k) {
        a.muQ[k] = cfg.muOffset + cfg.muScale * normal(rng);
    }

    // Sigma_q = s^2 (I + 0.1 A A^T / K): isotropic with a small random tilt
    Eigen::MatrixXd A(K, K);
    for (Eigen::Index c = 0; c < K; ++c) {
        for (Eigen::Index r = 0; r < K; ++r) {
            A(r, c) = normal(rng);
        }
    }
    const double s2 = cfg.sigmaScale * cfg.sigmaScale;
    Eigen::MatrixXd sigma = Eigen::MatrixXd::Identity(K, K) + (0.1 / static_cast<double>(K)) * A * A.transpose();
    a.sigmaQ = ensureSPD(s2 * sigma, 0.0);

    a.muP.resize(K);
    for (Eigen::Index k = 0; k < K; ++k) {
        a.muP[k] = cfg.priorMuScale * normal(rng);
    }
    a.sigmaP = ensureSPD(cfg.priorSigmaScale * cfg.priorSigmaScale * Eigen::MatrixXd::Identity(K, K), 0.0);

    for (int d = 0; d < 3; ++d) {
        a.phi[d] = cfg.gaugeScale * normal(rng);
    }

    // Drawn last so the pattern never shifts the belief draws
    a.support = createSupport(cfg.support, cfg.K, id, rng);
    a.lrMu = cfg.lrMu;
    a.lrSigma = cfg.lrSigma;
    return a;
}

std::vector<Agent> createAgents(std::uint32_t n, const AgentConfig& cfg, std::uint64_t seed) {
    std::vector<Agent> agents;
    agents.reserve(n);
    for (std::uint32_t i = 0; i < n; ++i) {
        std::mt19937_64 rng(seed + i);
        agents.push_back(createAgent(i, cfg, rng));
    }
    return agents;
}

void validateAgent(const Agent& agent, std::uint32_t K) {
    const std::string tag = "agent " + std::to_string(agent.id) + ": ";
    const Eigen::Index k = K;
    if (agent.muQ.size() != k || agent.muP.size() != k) {
        throw std::invalid_argument(tag + "mean dimension mismatch (expected K=" + std::to_string(K) + ")");
    }
    validation::checkSquare(agent.sigmaQ, k, "belief covariance");
    validation::checkSquare(agent.sigmaP, k, "prior covariance");
    validation::checkFinite(agent.muQ, "belief mean");
    validation::checkFinite(agent.muP, "prior mean");
    if (!isSPD(agent.sigmaQ)) {
        throw std::domain_error(tag + "belief covariance is not SPD");
    }
    if (!isSPD(agent.sigmaP)) {
        throw std::domain_error(tag + "prior covariance is not SPD");
    }
    validation::requireNonNegative(agent.lrMu, "lrMu");
    validation::requireNonNegative(agent.lrSigma, "lrSigma");
    if (agent.observation) {
        validation::checkLength(agent.observation->y, k, "observation");
        validation::checkSquare(agent.observation->covariance, k, "observation covariance");
        validation::checkFinite(agent.observation->y, "observation");
        if (!isSPD(agent.observation->covariance)) {
            throw std::domain_error(tag + "observation covariance is not SPD");
        }
    }
}
