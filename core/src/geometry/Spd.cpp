#include "geometry/Spd.h"
#include "utils/Validation.h"

#include <cmath>
#include <stdexcept>

Eigen::MatrixXd symmetrize(const Eigen::MatrixXd& m) {
    return 0.5 * (m + m.transpose());
}

Eigen::MatrixXd ensureSPD(const Eigen::MatrixXd& sigma, double eps) {
    validation::checkFinite(sigma, "covariance");
    validation::checkNonNegative(eps, "SPD regularizer");
    if (sigma.rows() != sigma.cols()) {
        throw std::domain_error("covariance must be square");
    }
    Eigen::MatrixXd out = symmetrize(sigma);
    out.diagonal().array() += eps;
    if (!isSPD(out)) {
        throw std::domain_error("covariance is not positive definite after regularization");
    }
    return out;
}

bool isSPD(const Eigen::MatrixXd& sigma) {
    if (sigma.rows() == 0 || sigma.rows() != sigma.cols() || !sigma.allFinite()) {
        return false;
    }
    Eigen::LLT<Eigen::MatrixXd> llt(symmetrize(sigma));
    if (llt.info() != Eigen::Success) {
        return false;
    }
    // LLT can "succeed" on matrices with a zero pivot that rounds to tiny > 0
    return (llt.matrixLLT().diagonal().array() > 0.0).all();
}

Eigen::MatrixXd checkedInverse(const Eigen::MatrixXd& sigma) {
    Eigen::LLT<Eigen::MatrixXd> llt(symmetrize(sigma));
    if (llt.info() != Eigen::Success) {
        throw std::domain_error("matrix inverse: not positive definite");
    }
    Eigen::MatrixXd inv = llt.solve(Eigen::MatrixXd::Identity(sigma.rows(), sigma.cols()));
    validation::checkFinite(inv, "matrix inverse");
    return symmetrize(inv);
}

double logDetSPD(const Eigen::MatrixXd& sigma) {
    Eigen::LLT<Eigen::MatrixXd> llt(symmetrize(sigma));
    if (llt.info() != Eigen::Success) {
        throw std::domain_error("log-determinant: not positive definite");
    }
    const auto diag = llt.matrixLLT().diagonal();
    double ld = 0.0;
    for (Eigen::Index i = 0; i < diag.size(); ++i) {
        ld += std::log(diag(i));
    }
    ld *= 2.0;
    validation::checkFinite(ld, "log-determinant");
    return ld;
}

namespace {

template <typename Fn>
Eigen::MatrixXd spectralMap(const Eigen::MatrixXd& s, Fn fn) {
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(symmetrize(s));
    if (es.info() != Eigen::Success) {
        throw std::domain_error("eigen decomposition failed");
    }
    Eigen::VectorXd d = es.eigenvalues().unaryExpr(fn);
    return symmetrize(es.eigenvectors() * d.asDiagonal() * es.eigenvectors().transpose());
}

}

Eigen::MatrixXd sqrtSPD(const Eigen::MatrixXd& sigma) {
    if (!isSPD(sigma)) {
        throw std::domain_error("matrix square root: not positive definite");
    }
    return spectralMap(sigma, [](double v) { return std::sqrt(v); });
}

Eigen::MatrixXd invSqrtSPD(const Eigen::MatrixXd& sigma) {
    if (!isSPD(sigma)) {
        throw std::domain_error("inverse square root: not positive definite");
    }
    return spectralMap(sigma, [](double v) { return 1.0 / std::sqrt(v); });
}

Eigen::MatrixXd expSymmetric(const Eigen::MatrixXd& s) {
    validation::checkFinite(s, "matrix exponential argument");
    return spectralMap(s, [](double v) { return std::exp(v); });
}

double minEigenvalue(const Eigen::MatrixXd& sigma) {
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(symmetrize(sigma), Eigen::EigenvaluesOnly);
    if (es.info() != Eigen::Success) {
        throw std::domain_error("eigen decomposition failed");
    }
    return es.eigenvalues().minCoeff();
}
