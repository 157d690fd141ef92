#include "modules/Retraction.h"
#include "geometry/Spd.h"
#include "utils/Validation.h"

#include <stdexcept>
#include <string>

namespace {

Eigen::MatrixXd verified(const Eigen::MatrixXd& out, const char* what) {
    if (!isSPD(out)) {
        throw std::domain_error(std::string(what) + ": could not restore an SPD matrix");
    }
    return out;
}

}

bool needsRepair(const Eigen::MatrixXd& proposed, double eps) {
    if (!isSPD(proposed)) return true;
    return minEigenvalue(proposed) < eps;
}

Eigen::MatrixXd retractSPD(const Eigen::MatrixXd& proposed, double eps) {
    validation::checkFinite(proposed, "retraction input");
    validation::checkPositive(eps, "retraction floor");
    const Eigen::MatrixXd sym = symmetrize(proposed);
    if (!needsRepair(sym, eps)) {
        return sym;
    }
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(sym);
    if (es.info() != Eigen::Success) {
        throw std::domain_error("retractSPD: eigen decomposition failed");
    }
    const Eigen::VectorXd d = es.eigenvalues().cwiseMax(eps);
    const Eigen::MatrixXd out = symmetrize(es.eigenvectors() * d.asDiagonal() * es.eigenvectors().transpose());
    return verified(out, "retractSPD");
}

Eigen::MatrixXd retractSPDCholesky(const Eigen::MatrixXd& proposed, double eps) {
    validation::checkFinite(proposed, "retraction input");
    validation::checkPositive(eps, "retraction floor");
    const Eigen::MatrixXd sym = symmetrize(proposed);
    if (!needsRepair(sym, eps)) {
        return sym;
    }

    Eigen::LDLT<Eigen::MatrixXd> ldlt(sym);
    if (ldlt.info() != Eigen::Success) {
        return retractSPD(sym, eps);
    }
    const Eigen::VectorXd d = ldlt.vectorD().cwiseMax(eps);
    const Eigen::Index k = sym.rows();

    Eigen::MatrixXd out = Eigen::MatrixXd::Identity(k, k);
    out = ldlt.transpositionsP() * out;
    out = ldlt.matrixU() * out;
    out = d.asDiagonal() * out;
    out = ldlt.matrixL() * out;
    out = ldlt.transpositionsP().transpose() * out;
    out = symmetrize(out);

    // Clipping D bounds the pivots, not the spectrum
    if (needsRepair(out, eps)) {
        return retractSPD(out, eps);
    }
    return verified(out, "retractSPDCholesky");
}

Eigen::MatrixXd retractSPDExponential(const Eigen::MatrixXd& sigma, const Eigen::MatrixXd& tangent) {
    validation::checkFinite(tangent, "retraction tangent");
    const Eigen::MatrixXd root = sqrtSPD(sigma);
    const Eigen::MatrixXd invRoot = invSqrtSPD(sigma);
    const Eigen::MatrixXd inner = symmetrize(invRoot * symmetrize(tangent) * invRoot);
    const Eigen::MatrixXd out = symmetrize(root * expSymmetric(inner) * root);
    return verified(out, "retractSPDExponential");
}

Eigen::MatrixXd retract(RetractionMode mode, const Eigen::MatrixXd& sigma,
                        const Eigen::MatrixXd& tangent, double eps) {
    switch (mode) {
        case RetractionMode::Eigenvalue:
            return retractSPD(sigma + tangent, eps);
        case RetractionMode::Cholesky:
            return retractSPDCholesky(sigma + tangent, eps);
        case RetractionMode::Exponential: {
            Eigen::MatrixXd out = retractSPDExponential(sigma, tangent);
            return needsRepair(out, eps) ? retractSPD(out, eps) : out;
        }
    }
    throw std::invalid_argument("unknown retraction mode");
}
