#ifndef VFE_CONFIG_H
#define VFE_CONFIG_H

#include <cstdint>

// ---------- Configuration ----------
// Plain structs with defaults. Each has a single validate() entry point that
// throws std::invalid_argument; constructors call it so a bad combination is
// rejected at setup, never mid-run.

enum class RetractionMode : std::uint8_t {
    Eigenvalue = 0,   // clip eigenvalues of the proposed matrix
    Cholesky = 1,     // pivoted LDL^T, clip D, recompose
    Exponential = 2   // affine-invariant exponential map
};

enum class CouplingTopology : std::uint8_t {
    FullyConnected = 0,
    SmallWorld = 1,   // Watts-Strogatz ring lattice + rewiring
    Isolated = 2
};

enum class SupportPattern : std::uint8_t {
    Full = 0,     // every coordinate
    Window = 1,   // coordinates within radius of (id mod K)
    Random = 2    // each coordinate held with probability density
};

struct SupportPatternConfig {
    SupportPattern pattern = SupportPattern::Full;
    std::uint32_t radius = 1;       // Window half-width
    bool periodic = false;          // Window wraps around the coordinate range
    double density = 0.5;           // Random: probability a coordinate is held

    void validate() const;
};

struct AgentConfig {
    std::uint32_t K = 3;            // belief dimension
    double muScale = 0.5;           // std dev of initial belief mean
    double muOffset = 0.0;          // shift added to every mean component
    double sigmaScale = 0.3;        // initial belief std dev
    double priorMuScale = 0.5;      // std dev of prior mean
    double priorSigmaScale = 1.0;   // prior std dev
    double lrMu = 0.1;              // mean learning rate
    double lrSigma = 0.01;          // covariance learning rate
    double gaugeScale = 0.0;        // std dev of gauge angles (0 = shared frame)
    SupportPatternConfig support;   // which coordinates the agent holds opinions on

    void validate() const;
};

struct SystemConfig {
    double lambdaSelf = 1.0;
    double lambdaBeliefAlign = 1.0;
    double lambdaPriorAlign = 0.0;
    double kappaBeta = 1.0;         // belief attention temperature
    double kappaGamma = 1.0;        // prior attention temperature
    double spdEpsilon = 1e-8;       // regularizer when admitting covariances

    void validate() const;
};

struct CouplingConfig {
    CouplingTopology topology = CouplingTopology::FullyConnected;
    std::uint32_t avgConnections = 4;  // k (even) for SmallWorld
    double rewireProb = 0.05;
    std::uint64_t seed = 42;

    void validate() const;
};

struct MassMatrixConfig {
    bool includePrior = true;
    bool includeObservation = true;
    bool includeSocial = true;
    double regularization = 1e-8;

    void validate() const;
};

// Enabled: covariance velocities carry the Fisher metric and its curvature
// term. Disabled: they carry the flat metric tr(dS dS) and no curvature.
struct GeodesicConfig {
    bool enabled = true;
};

struct TrainingConfig {
    int nSteps = 100;
    double convergenceTol = 0.0;    // stop when |E_{t-1} - E_t| < tol (0 = never)
    RetractionMode retraction = RetractionMode::Cholesky;
    double spdEpsilon = 1e-8;       // eigenvalue floor used by retraction

    void validate() const;
};

struct HamiltonianConfig {
    int nSteps = 100;
    double dt = 0.05;
    double friction = 0.0;          // gamma; momenta scaled by exp(-gamma dt/2) per half-kick
    bool evolveCovariance = true;
    double driftTolerance = 0.1;    // relative |H - H0| that is logged as drift
    GeodesicConfig geodesic;
    MassMatrixConfig mass;
    RetractionMode retraction = RetractionMode::Cholesky;
    double spdEpsilon = 1e-8;

    void validate() const;
};

#endif
