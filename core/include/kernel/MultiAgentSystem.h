#ifndef MULTI_AGENT_SYSTEM_H
#define MULTI_AGENT_SYSTEM_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>
#include <Eigen/Dense>
#include "geometry/Gaussian.h"
#include "geometry/Manifold.h"
#include "geometry/Transport.h"
#include "kernel/Agent.h"
#include "kernel/Config.h"

/**
 * Population of interacting agents plus who-influences-whom.
 *
 * The system is the unit of mutation: integrators read a full snapshot,
 * compute one force field, and hand all new beliefs to commitBeliefs() at
 * once. Nothing mutates one agent while another agent's coupling terms are
 * still being evaluated.
 *
 * Neighbour lists are directed: j in neighbors(i) means j influences i.
 */
class MultiAgentSystem {
public:
    using NeighborLists = std::vector<std::vector<std::uint32_t>>;

    explicit MultiAgentSystem(std::vector<Agent> agents,
                              const SystemConfig& cfg = {},
                              const CouplingConfig& coupling = {},
                              TopologyType topology = TopologyType::Flat);

    MultiAgentSystem(std::vector<Agent> agents,
                     const SystemConfig& cfg,
                     NeighborLists neighbors,
                     TopologyType topology = TopologyType::Flat);

    // Access
    std::size_t size() const { return agents_.size(); }
    std::uint32_t dim() const { return K_; }
    const std::vector<Agent>& agents() const { return agents_; }
    const Agent& agent(std::size_t i) const { return agents_.at(i); }
    const SystemConfig& config() const { return cfg_; }
    const BaseManifold& manifold() const { return manifold_; }
    const NeighborLists& neighbors() const { return neighbors_; }
    const SO3Generators& generators() const { return generators_; }

    // chi_ij (support overlap) on edges i <- j, 0 elsewhere and on the diagonal
    const Eigen::MatrixXd& couplingMatrix() const { return coupling_; }
    bool coupled(std::size_t i, std::size_t j) const { return coupling_(i, j) > 0.0; }

    // Coordinates both agents support, in frame i. A pair with only some
    // coordinates in common is compared on those alone; a pair with none is
    // never coupled.
    const std::vector<std::uint32_t>& sharedDimensions(std::size_t i, std::size_t j) const {
        return shared_.at(i * agents_.size() + j);
    }
    bool partialOverlap(std::size_t i, std::size_t j) const {
        const std::size_t n = sharedDimensions(i, j).size();
        return n > 0 && n < K_;
    }
    // Rows of Omega_ij on the shared coordinates: frame j -> shared part of frame i
    Eigen::MatrixXd sharedTransport(std::size_t i, std::size_t j) const;

    const Eigen::MatrixXd& rotation(std::size_t i) const { return rotations_.at(i); }
    // Omega_ij: frame j -> frame i
    const Eigen::MatrixXd& transport(std::size_t i, std::size_t j) const {
        return transports_.at(i * agents_.size() + j);
    }

    // Observations (evidence for the next steps)
    void setObservation(std::size_t i, Observation obs);
    void clearObservation(std::size_t i);
    void clearObservations();

    // Snapshot helpers: precision + log det per agent
    std::vector<PrecomputedGaussian> precomputeBeliefs() const;
    std::vector<PrecomputedGaussian> precomputePriors() const;

    // Synchronous all-or-nothing commit of new beliefs. Every entry is
    // checked (finite, SPD) before any agent is written.
    void commitBeliefs(const std::vector<Gaussian>& beliefs);

private:
    void buildFullyConnected();
    void buildSmallWorld(const CouplingConfig& coupling);
    void finalize();

    SystemConfig cfg_;
    std::vector<Agent> agents_;
    std::uint32_t K_ = 0;
    BaseManifold manifold_;
    NeighborLists neighbors_;
    Eigen::MatrixXd coupling_;
    SO3Generators generators_;
    std::vector<Eigen::MatrixXd> rotations_;
    std::vector<Eigen::MatrixXd> transports_;
    std::vector<std::vector<std::uint32_t>> shared_;
};

#endif
