#include "geometry/Transport.h"

#include <cmath>
#include <stdexcept>
#include <string>

SO3Generators generateSO3Generators(int K) {
    if (K < 1) {
        throw std::invalid_argument("SO(3) generators need K >= 1 (got " + std::to_string(K) + ")");
    }
    SO3Generators gens;
    for (auto& g : gens) {
        g = Eigen::MatrixXd::Zero(K, K);
    }
    // (G_a)_{bc} = -epsilon_{abc} on each 3-block
    const int blocks = K / 3;
    for (int blk = 0; blk < blocks; ++blk) {
        const int o = 3 * blk;
        gens[0](o + 1, o + 2) = -1.0;
        gens[0](o + 2, o + 1) = 1.0;
        gens[1](o + 0, o + 2) = 1.0;
        gens[1](o + 2, o + 0) = -1.0;
        gens[2](o + 0, o + 1) = -1.0;
        gens[2](o + 1, o + 0) = 1.0;
    }
    return gens;
}

Eigen::MatrixXd gaugeRotation(const Eigen::Vector3d& phi, const SO3Generators& generators) {
    if (!phi.allFinite()) {
        throw std::domain_error("gauge frame contains NaN or Inf");
    }
    const Eigen::Index k = generators[0].rows();
    const Eigen::MatrixXd x = phi[0] * generators[0] + phi[1] * generators[1] + phi[2] * generators[2];
    const double theta = phi.norm();

    double a;  // sin(theta)/theta
    double b;  // (1 - cos(theta))/theta^2
    if (theta < 1e-4) {
        const double t2 = theta * theta;
        a = 1.0 - t2 / 6.0;
        b = 0.5 - t2 / 24.0;
    } else {
        a = std::sin(theta) / theta;
        b = (1.0 - std::cos(theta)) / (theta * theta);
    }
    return Eigen::MatrixXd::Identity(k, k) + a * x + b * x * x;
}

Eigen::MatrixXd transportOperator(const Eigen::MatrixXd& rotationI, const Eigen::MatrixXd& rotationJ) {
    return rotationI * rotationJ.transpose();
}
