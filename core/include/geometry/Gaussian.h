#ifndef GAUSSIAN_H
#define GAUSSIAN_H

#include <cstdint>
#include <vector>
#include <Eigen/Dense>

// ---------- Gaussian beliefs on the statistical manifold ----------
struct Gaussian {
    Eigen::VectorXd mu;
    Eigen::MatrixXd sigma;
};

/**
 * Gaussian with its precision and log-determinant cached.
 *
 * Pairwise KL over an N-agent population needs each factorization once per
 * step, not once per pair. Transport by an orthogonal operator keeps logDet.
 */
struct PrecomputedGaussian {
    Eigen::VectorXd mu;
    Eigen::MatrixXd sigma;
    Eigen::MatrixXd precision;
    double logDet = 0.0;
};

PrecomputedGaussian precompute(const Gaussian& g);
PrecomputedGaussian precompute(const Eigen::VectorXd& mu, const Eigen::MatrixXd& sigma);

// (Omega mu, Omega Sigma Omega^T). Any r x K map of full row rank is allowed
// for the plain version (r < K gives a marginal); the precomputed version
// reuses the cached factorization and needs Omega orthogonal.
Gaussian transportGaussian(const Gaussian& g, const Eigen::MatrixXd& omega);
PrecomputedGaussian transportGaussian(const PrecomputedGaussian& g, const Eigen::MatrixXd& omega);

// |dims| x K rows of the identity: P mu picks the listed coordinates
Eigen::MatrixXd coordinateSelection(const std::vector<std::uint32_t>& dims, Eigen::Index K);

// KL(q || p) for K-variate Gaussians, clamped at 0 against rounding
double klGaussian(const PrecomputedGaussian& q, const PrecomputedGaussian& p);
double klGaussian(const Gaussian& q, const Gaussian& p);

// Partial derivatives of KL(q || p) with respect to both arguments
struct KLGradients {
    Eigen::VectorXd dMuQ;
    Eigen::MatrixXd dSigmaQ;
    Eigen::VectorXd dMuP;
    Eigen::MatrixXd dSigmaP;
};

KLGradients klGradients(const PrecomputedGaussian& q, const PrecomputedGaussian& p);

double entropyGaussian(const Gaussian& g);

// ---------- Fisher information metric ----------
// Dense Fisher matrix over (mu, vec Sigma): blockdiag(Sigma^-1, 1/2 Sigma^-1 (x) Sigma^-1).
// Size K + K*K.
Eigen::MatrixXd fisherMatrix(const Gaussian& g);

// Inverse Fisher applied to Euclidean covectors
Eigen::VectorXd raiseMeanGradient(const Eigen::MatrixXd& sigma, const Eigen::VectorXd& grad);
Eigen::MatrixXd raiseCovarianceGradient(const Eigen::MatrixXd& sigma, const Eigen::MatrixXd& grad);

// Fisher inner product of two covariance tangents: 1/2 tr(P A P B)
double fisherCovarianceInner(const Eigen::MatrixXd& precision,
                             const Eigen::MatrixXd& a,
                             const Eigen::MatrixXd& b);

#endif
