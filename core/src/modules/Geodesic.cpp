#include "modules/Geodesic.h"
#include "geometry/Spd.h"

Eigen::MatrixXd geodesicAcceleration(const Eigen::MatrixXd& sigma, const Eigen::MatrixXd& sigmaVel) {
    const Eigen::MatrixXd precision = checkedInverse(sigma);
    return symmetrize(sigmaVel * precision * sigmaVel);
}
