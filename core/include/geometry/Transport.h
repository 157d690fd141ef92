#ifndef TRANSPORT_H
#define TRANSPORT_H

#include <array>
#include <Eigen/Dense>

// ---------- Gauge frames and parallel transport ----------
// Each agent carries a frame phi in so(3) (axis-angle). Belief coordinates
// carry the representation
//     V_K = (vector rep)^{floor(K/3)} (+) (trivial)^{K mod 3}
// so SO(3) acts on every K. For K < 3 all coordinates are gauge invariant
// and transport is the identity.

using SO3Generators = std::array<Eigen::MatrixXd, 3>;

// Skew-symmetric K x K generators with [G_x, G_y] = G_z on each vector block
SO3Generators generateSO3Generators(int K);

// exp(phi . G). Closed Rodrigues form: on this representation X^3 = -theta^2 X.
Eigen::MatrixXd gaugeRotation(const Eigen::Vector3d& phi, const SO3Generators& generators);

// Omega_ij = R_i R_j^T : carries a distribution expressed in frame j into frame i
Eigen::MatrixXd transportOperator(const Eigen::MatrixXd& rotationI, const Eigen::MatrixXd& rotationJ);

#endif
