#include "geometry/Gaussian.h"
#include "geometry/Spd.h"
#include "utils/Validation.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace {
constexpr double kLog2Pi = 1.8378770664093453;
}

PrecomputedGaussian precompute(const Eigen::VectorXd& mu, const Eigen::MatrixXd& sigma) {
    PrecomputedGaussian out;
    out.mu = mu;
    out.sigma = sigma;
    out.precision = checkedInverse(sigma);
    out.logDet = logDetSPD(sigma);
    return out;
}

PrecomputedGaussian precompute(const Gaussian& g) {
    return precompute(g.mu, g.sigma);
}

Gaussian transportGaussian(const Gaussian& g, const Eigen::MatrixXd& omega) {
    Gaussian out;
    out.mu = omega * g.mu;
    out.sigma = symmetrize(omega * g.sigma * omega.transpose());
    return out;
}

PrecomputedGaussian transportGaussian(const PrecomputedGaussian& g, const Eigen::MatrixXd& omega) {
    PrecomputedGaussian out;
    out.mu = omega * g.mu;
    out.sigma = symmetrize(omega * g.sigma * omega.transpose());
    out.precision = symmetrize(omega * g.precision * omega.transpose());
    out.logDet = g.logDet;
    return out;
}

Eigen::MatrixXd coordinateSelection(const std::vector<std::uint32_t>& dims, Eigen::Index K) {
    Eigen::MatrixXd p = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(dims.size()), K);
    for (std::size_t r = 0; r < dims.size(); ++r) {
        if (static_cast<Eigen::Index>(dims[r]) >= K) {
            throw std::invalid_argument("coordinate " + std::to_string(dims[r]) +
                                        " outside dimension " + std::to_string(K));
        }
        p(static_cast<Eigen::Index>(r), dims[r]) = 1.0;
    }
    return p;
}

double klGaussian(const PrecomputedGaussian& q, const PrecomputedGaussian& p) {
    const Eigen::VectorXd delta = p.mu - q.mu;
    const double k = static_cast<double>(q.mu.size());
    const double trace = (p.precision.cwiseProduct(q.sigma)).sum();
    const double mahal = delta.dot(p.precision * delta);
    const double kl = 0.5 * (trace + mahal - k + p.logDet - q.logDet);
    validation::checkFinite(kl, "KL divergence");
    return std::max(0.0, kl);
}

double klGaussian(const Gaussian& q, const Gaussian& p) {
    return klGaussian(precompute(q), precompute(p));
}

KLGradients klGradients(const PrecomputedGaussian& q, const PrecomputedGaussian& p) {
    KLGradients g;
    const Eigen::VectorXd delta = q.mu - p.mu;
    g.dMuQ = p.precision * delta;
    g.dMuP = -g.dMuQ;
    g.dSigmaQ = 0.5 * (p.precision - q.precision);
    const Eigen::MatrixXd outer = q.sigma + delta * delta.transpose();
    g.dSigmaP = symmetrize(0.5 * (p.precision - p.precision * outer * p.precision));
    return g;
}

double entropyGaussian(const Gaussian& g) {
    const double k = static_cast<double>(g.mu.size());
    return 0.5 * (k * (1.0 + kLog2Pi) + logDetSPD(g.sigma));
}

Eigen::MatrixXd fisherMatrix(const Gaussian& g) {
    const Eigen::Index k = g.mu.size();
    const Eigen::MatrixXd prec = checkedInverse(g.sigma);
    Eigen::MatrixXd f = Eigen::MatrixXd::Zero(k + k * k, k + k * k);
    f.topLeftCorner(k, k) = prec;
    // Kronecker block, vec taken column-major: index(a, b) = a + b*K
    for (Eigen::Index b = 0; b < k; ++b) {
        for (Eigen::Index a = 0; a < k; ++a) {
            for (Eigen::Index d = 0; d < k; ++d) {
                for (Eigen::Index c = 0; c < k; ++c) {
                    f(k + a + b * k, k + c + d * k) = 0.5 * prec(b, d) * prec(a, c);
                }
            }
        }
    }
    return f;
}

Eigen::VectorXd raiseMeanGradient(const Eigen::MatrixXd& sigma, const Eigen::VectorXd& grad) {
    return sigma * grad;
}

Eigen::MatrixXd raiseCovarianceGradient(const Eigen::MatrixXd& sigma, const Eigen::MatrixXd& grad) {
    return symmetrize(2.0 * sigma * symmetrize(grad) * sigma);
}

double fisherCovarianceInner(const Eigen::MatrixXd& precision,
                             const Eigen::MatrixXd& a,
                             const Eigen::MatrixXd& b) {
    return 0.5 * (precision * a * precision * b).trace();
}
