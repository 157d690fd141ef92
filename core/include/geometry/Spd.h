#ifndef SPD_H
#define SPD_H

#include <Eigen/Dense>

// ---------- SPD utilities ----------
// ensureSPD is the chokepoint for the covariance invariant: every belief or
// prior covariance entering the system passes through it or a retraction.

Eigen::MatrixXd symmetrize(const Eigen::MatrixXd& m);

// Symmetrize, add eps*I and verify by Cholesky. Throws std::domain_error on
// NaN/Inf or when the regularized matrix still has a non-positive mode.
Eigen::MatrixXd ensureSPD(const Eigen::MatrixXd& sigma, double eps = 1e-6);

// True when the symmetric part factorizes by LLT and is finite.
bool isSPD(const Eigen::MatrixXd& sigma);

// Inverse of an SPD matrix via LLT; throws std::domain_error if not SPD.
Eigen::MatrixXd checkedInverse(const Eigen::MatrixXd& sigma);

// log det of an SPD matrix (2 * sum log diag L); throws if not SPD.
double logDetSPD(const Eigen::MatrixXd& sigma);

// Symmetric square root and inverse square root through the eigen basis.
Eigen::MatrixXd sqrtSPD(const Eigen::MatrixXd& sigma);
Eigen::MatrixXd invSqrtSPD(const Eigen::MatrixXd& sigma);

// exp of a symmetric matrix
Eigen::MatrixXd expSymmetric(const Eigen::MatrixXd& s);

double minEigenvalue(const Eigen::MatrixXd& sigma);

#endif
