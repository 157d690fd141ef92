#ifndef RETRACTION_H
#define RETRACTION_H

#include <Eigen/Dense>
#include "kernel/Config.h"

// ---------- SPD retractions ----------
// A raw gradient step on a covariance is not trusted to stay SPD. Each
// retraction either returns a matrix that factorizes by Cholesky with every
// mode >= eps, or throws std::domain_error; there is no best-effort result.

// True when `proposed` is not SPD or has a mode below eps
bool needsRepair(const Eigen::MatrixXd& proposed, double eps);

// Symmetrize, clip eigenvalues at eps, recompose
Eigen::MatrixXd retractSPD(const Eigen::MatrixXd& proposed, double eps = 1e-8);

// Pivoted LDL^T: clip D at eps, recompose P^T L D L^T P, verify by LLT.
// Falls back to eigenvalue clipping when the factorization itself fails.
Eigen::MatrixXd retractSPDCholesky(const Eigen::MatrixXd& proposed, double eps = 1e-8);

// Affine-invariant exponential map: S^1/2 exp(S^-1/2 T S^-1/2) S^1/2.
// SPD for any finite symmetric tangent T.
Eigen::MatrixXd retractSPDExponential(const Eigen::MatrixXd& sigma, const Eigen::MatrixXd& tangent);

// sigma + tangent, restored to the SPD cone by the chosen mode
Eigen::MatrixXd retract(RetractionMode mode, const Eigen::MatrixXd& sigma,
                        const Eigen::MatrixXd& tangent, double eps);

#endif
