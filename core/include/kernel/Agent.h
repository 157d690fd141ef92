#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <vector>
#include <Eigen/Dense>
#include "geometry/Gaussian.h"
#include "geometry/Manifold.h"
#include "kernel/Config.h"

// External evidence attached to an agent for the current step
struct Observation {
    Eigen::VectorXd y;
    Eigen::MatrixXd covariance;  // SPD
};

// ---------- Agent Structure ----------
struct Agent {
    // Identity
    std::uint32_t id = 0;

    // Belief q = N(muQ, sigmaQ)
    Eigen::VectorXd muQ;
    Eigen::MatrixXd sigmaQ;

    // Prior p = N(muP, sigmaP), fixed during a run
    Eigen::VectorXd muP;
    Eigen::MatrixXd sigmaP;

    // Gauge frame (axis-angle in so(3))
    Eigen::Vector3d phi = Eigen::Vector3d::Zero();

    // Coordinates of the base manifold the agent holds opinions on
    SupportRegion support;

    double lrMu = 0.1;
    double lrSigma = 0.01;

    std::optional<Observation> observation;

    std::uint32_t K() const { return static_cast<std::uint32_t>(muQ.size()); }
    Gaussian belief() const { return {muQ, sigmaQ}; }
    Gaussian prior() const { return {muP, sigmaP}; }
};

// Support over the K belief coordinates. Full and Window are deterministic;
// Random consumes K uniform draws from rng.
SupportRegion createSupport(const SupportPatternConfig& cfg, std::uint32_t K,
                            std::uint32_t id, std::mt19937_64& rng);

// Samples mean, covariance, prior and frame from the given source. Draw order
// is fixed, so a given rng state always yields the same agent.
Agent createAgent(std::uint32_t id, const AgentConfig& cfg, std::mt19937_64& rng);

// Agent i draws from its own std::mt19937_64(seed + i)
std::vector<Agent> createAgents(std::uint32_t n, const AgentConfig& cfg, std::uint64_t seed);

// Shape / SPD checks for one agent against belief dimension K
void validateAgent(const Agent& agent, std::uint32_t K);
