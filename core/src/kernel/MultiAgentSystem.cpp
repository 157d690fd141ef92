#include "kernel/MultiAgentSystem.h"
#include "geometry/Spd.h"
#include "utils/Validation.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace {

std::uint32_t commonDimension(const std::vector<Agent>& agents) {
    if (agents.empty()) {
        throw std::invalid_argument("multi-agent system needs at least one agent");
    }
    const std::uint32_t K = agents.front().K();
    if (K == 0) {
        throw std::invalid_argument("belief dimension must be > 0");
    }
    return K;
}

}

MultiAgentSystem::MultiAgentSystem(std::vector<Agent> agents,
                                   const SystemConfig& cfg,
                                   const CouplingConfig& coupling,
                                   TopologyType topology)
    : cfg_(cfg),
      agents_(std::move(agents)),
      K_(commonDimension(agents_)),
      manifold_(std::max<std::uint32_t>(K_, 1), topology) {
    cfg_.validate();
    coupling.validate();
    neighbors_.assign(agents_.size(), {});
    switch (coupling.topology) {
        case CouplingTopology::FullyConnected:
            buildFullyConnected();
            break;
        case CouplingTopology::SmallWorld:
            buildSmallWorld(coupling);
            break;
        case CouplingTopology::Isolated:
            break;
    }
    finalize();
}

MultiAgentSystem::MultiAgentSystem(std::vector<Agent> agents,
                                   const SystemConfig& cfg,
                                   NeighborLists neighbors,
                                   TopologyType topology)
    : cfg_(cfg),
      agents_(std::move(agents)),
      K_(commonDimension(agents_)),
      manifold_(std::max<std::uint32_t>(K_, 1), topology),
      neighbors_(std::move(neighbors)) {
    cfg_.validate();
    if (neighbors_.size() != agents_.size()) {
        throw std::invalid_argument("neighbor lists: expected " + std::to_string(agents_.size()) +
                                    " entries, got " + std::to_string(neighbors_.size()));
    }
    for (std::size_t i = 0; i < neighbors_.size(); ++i) {
        std::unordered_set<std::uint32_t> seen;
        for (std::uint32_t j : neighbors_[i]) {
            if (j >= agents_.size()) {
                throw std::invalid_argument("neighbor id " + std::to_string(j) + " out of range");
            }
            if (j == i) {
                throw std::invalid_argument("agent " + std::to_string(i) + " lists itself as neighbor");
            }
            if (!seen.insert(j).second) {
                throw std::invalid_argument("agent " + std::to_string(i) + " lists neighbor " +
                                            std::to_string(j) + " twice");
            }
        }
    }
    finalize();
}

void MultiAgentSystem::buildFullyConnected() {
    const std::uint32_t N = static_cast<std::uint32_t>(agents_.size());
    for (std::uint32_t i = 0; i < N; ++i) {
        neighbors_[i].reserve(N - 1);
        for (std::uint32_t j = 0; j < N; ++j) {
            if (j != i) neighbors_[i].push_back(j);
        }
    }
}

void MultiAgentSystem::buildSmallWorld(const CouplingConfig& coupling) {
    const std::uint32_t N = static_cast<std::uint32_t>(agents_.size());
    std::uint32_t K = coupling.avgConnections;
    if (K % 2) ++K;  // ensure even
    if (N < 3 || K >= N - 1) {
        // Lattice would wrap onto itself
        buildFullyConnected();
        return;
    }
    const std::uint32_t halfK = K / 2;

    std::mt19937_64 rng(coupling.seed);
    std::uniform_real_distribution<double> uniDist(0.0, 1.0);
    std::uniform_int_distribution<std::uint32_t> nodeDist(0, N - 1);

    // Ring lattice - forward edges, mirrored
    for (std::uint32_t i = 0; i < N; ++i) {
        for (std::uint32_t d = 1; d <= halfK; ++d) {
            std::uint32_t j = (i + d) % N;
            neighbors_[i].push_back(j);
            neighbors_[j].push_back(i);
        }
    }

    // Rewiring
    for (std::uint32_t i = 0; i < N; ++i) {
        std::unordered_set<std::uint32_t> current(neighbors_[i].begin(), neighbors_[i].end());

        for (std::uint32_t d = 1; d <= halfK; ++d) {
            if (uniDist(rng) >= coupling.rewireProb) continue;
            const std::uint32_t oldJ = (i + d) % N;
            if (current.count(oldJ) == 0) continue;

            std::uint32_t newJ;
            int attempts = 0;
            const int maxAttempts = static_cast<int>(N) * 2;
            do {
                newJ = nodeDist(rng);
                if (++attempts > maxAttempts) break;
            } while (newJ == i || current.count(newJ));
            if (attempts > maxAttempts) continue;

            auto& niNbrs = neighbors_[i];
            auto& njNbrs = neighbors_[oldJ];
            niNbrs.erase(std::remove(niNbrs.begin(), niNbrs.end(), oldJ), niNbrs.end());
            njNbrs.erase(std::remove(njNbrs.begin(), njNbrs.end(), i), njNbrs.end());
            current.erase(oldJ);

            neighbors_[i].push_back(newJ);
            neighbors_[newJ].push_back(i);
            current.insert(newJ);
        }
    }

    for (auto& nbrs : neighbors_) {
        std::sort(nbrs.begin(), nbrs.end());
    }
}

void MultiAgentSystem::finalize() {
    const std::size_t N = agents_.size();
    for (std::size_t i = 0; i < N; ++i) {
        Agent& a = agents_[i];
        if (a.support.chi.empty()) {
            a.support = createFullSupport(manifold_);
        }
        if (a.id != i) {
            throw std::invalid_argument("agent at index " + std::to_string(i) + " has id " +
                                        std::to_string(a.id) + "; ids must match positions");
        }
        if (a.K() != K_) {
            throw std::invalid_argument("agent " + std::to_string(i) + " has belief dimension " +
                                        std::to_string(a.K()) + ", system has " + std::to_string(K_));
        }
        validateAgent(a, K_);
        validateSupport(a.support, manifold_);
    }

    coupling_ = Eigen::MatrixXd::Zero(N, N);
    for (std::size_t i = 0; i < N; ++i) {
        for (std::uint32_t j : neighbors_[i]) {
            coupling_(i, j) = supportOverlap(agents_[i].support, agents_[j].support);
        }
    }
    shared_.assign(N * N, {});
    for (std::size_t i = 0; i < N; ++i) {
        for (std::size_t j = 0; j < N; ++j) {
            if (i != j) shared_[i * N + j] = ::sharedDimensions(agents_[i].support, agents_[j].support);
        }
    }

    generators_ = generateSO3Generators(static_cast<int>(K_));
    rotations_.clear();
    rotations_.reserve(N);
    for (const auto& a : agents_) {
        rotations_.push_back(gaugeRotation(a.phi, generators_));
    }
    transports_.assign(N * N, Eigen::MatrixXd());
    for (std::size_t i = 0; i < N; ++i) {
        for (std::size_t j = 0; j < N; ++j) {
            transports_[i * N + j] = transportOperator(rotations_[i], rotations_[j]);
        }
    }
}

Eigen::MatrixXd MultiAgentSystem::sharedTransport(std::size_t i, std::size_t j) const {
    const Eigen::MatrixXd& omega = transport(i, j);
    if (!partialOverlap(i, j)) {
        return omega;
    }
    return coordinateSelection(sharedDimensions(i, j), K_) * omega;
}

void MultiAgentSystem::setObservation(std::size_t i, Observation obs) {
    Agent& a = agents_.at(i);
    validation::checkLength(obs.y, K_, "observation");
    validation::checkSquare(obs.covariance, K_, "observation covariance");
    validation::checkFinite(obs.y, "observation");
    obs.covariance = ensureSPD(obs.covariance, cfg_.spdEpsilon);
    a.observation = std::move(obs);
}

void MultiAgentSystem::clearObservation(std::size_t i) {
    agents_.at(i).observation.reset();
}

void MultiAgentSystem::clearObservations() {
    for (auto& a : agents_) {
        a.observation.reset();
    }
}

std::vector<PrecomputedGaussian> MultiAgentSystem::precomputeBeliefs() const {
    std::vector<PrecomputedGaussian> out;
    out.reserve(agents_.size());
    for (const auto& a : agents_) {
        out.push_back(precompute(a.muQ, a.sigmaQ));
    }
    return out;
}

std::vector<PrecomputedGaussian> MultiAgentSystem::precomputePriors() const {
    std::vector<PrecomputedGaussian> out;
    out.reserve(agents_.size());
    for (const auto& a : agents_) {
        out.push_back(precompute(a.muP, a.sigmaP));
    }
    return out;
}

void MultiAgentSystem::commitBeliefs(const std::vector<Gaussian>& beliefs) {
    if (beliefs.size() != agents_.size()) {
        throw std::invalid_argument("commitBeliefs: expected " + std::to_string(agents_.size()) +
                                    " beliefs, got " + std::to_string(beliefs.size()));
    }
    for (std::size_t i = 0; i < beliefs.size(); ++i) {
        const auto& b = beliefs[i];
        validation::checkLength(b.mu, K_, "committed mean");
        validation::checkSquare(b.sigma, K_, "committed covariance");
        validation::checkFinite(b.mu, "committed mean");
        if (!isSPD(b.sigma)) {
            throw std::domain_error("commitBeliefs: covariance of agent " + std::to_string(i) +
                                    " is not SPD");
        }
    }
    for (std::size_t i = 0; i < beliefs.size(); ++i) {
        agents_[i].muQ = beliefs[i].mu;
        agents_[i].sigmaQ = beliefs[i].sigma;
    }
}
