#ifndef GEODESIC_H
#define GEODESIC_H

#include <Eigen/Dense>

/**
 * Curvature correction for momentum transport of a covariance.
 *
 * The Hamiltonian integrator uses the metric blockdiag(M_i, 1/2 Fisher_S):
 * the epistemic mass on the mean, held fixed within a step, and
 *   ds^2 = 1/2 tr(S^-1 dS S^-1 dS)
 * on the covariance. The mean block is constant, so its Christoffel symbols
 * vanish. On the covariance, geodesics of the affine-invariant metric satisfy
 *   Sigma'' = S' S^-1 S'
 * and this is the acceleration returned for velocity V = S'.
 */
Eigen::MatrixXd geodesicAcceleration(const Eigen::MatrixXd& sigma, const Eigen::MatrixXd& sigmaVel);

#endif
