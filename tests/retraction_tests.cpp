#include <gtest/gtest.h>
#include "geometry/Spd.h"
#include "modules/Retraction.h"

#include <limits>
#include <stdexcept>

namespace {

Eigen::MatrixXd indefinite() {
    Eigen::MatrixXd m(3, 3);
    m << 1.0, 0.0, 0.0,
         0.0, -0.5, 0.0,
         0.0, 0.0, 2.0;
    return m;
}

}  // namespace

TEST(RetractionTest, SPDInputPassesThrough) {
    Eigen::MatrixXd m(2, 2);
    m << 1.0, 0.3,
         0.3, 0.8;
    EXPECT_FALSE(needsRepair(m, 1e-8));
    EXPECT_TRUE(retractSPD(m).isApprox(m, 1e-15));
    EXPECT_TRUE(retractSPDCholesky(m).isApprox(m, 1e-15));
}

TEST(RetractionTest, EigenvalueClipRepairsIndefinite) {
    const Eigen::MatrixXd out = retractSPD(indefinite(), 1e-4);
    EXPECT_TRUE(isSPD(out));
    EXPECT_NEAR(minEigenvalue(out), 1e-4, 1e-12);
    EXPECT_NEAR(out(2, 2), 2.0, 1e-12);
}

TEST(RetractionTest, CholeskyRepairsIndefinite) {
    Eigen::MatrixXd m = indefinite();
    m(0, 1) = m(1, 0) = 0.4;
    ASSERT_TRUE(needsRepair(m, 1e-6));
    const Eigen::MatrixXd out = retractSPDCholesky(m, 1e-6);
    EXPECT_TRUE(isSPD(out));
    EXPECT_GE(minEigenvalue(out), 1e-6 * (1.0 - 1e-9));
}

TEST(RetractionTest, ExponentialMapStaysSPDForLargeSteps) {
    const Eigen::MatrixXd sigma = Eigen::MatrixXd::Identity(2, 2);
    Eigen::MatrixXd t(2, 2);
    t << -5.0, 1.0,
         1.0, -3.0;
    // sigma + t is negative definite; the exponential map never is
    const Eigen::MatrixXd out = retractSPDExponential(sigma, t);
    EXPECT_TRUE(isSPD(out));
    EXPECT_TRUE(out.isApprox(expSymmetric(t), 1e-10));
}

TEST(RetractionTest, ModesAgreeForSmallSteps) {
    Eigen::MatrixXd sigma(2, 2);
    sigma << 0.9, 0.1,
             0.1, 0.6;
    Eigen::MatrixXd t(2, 2);
    t << 1e-4, 0.0,
         0.0, -2e-4;
    const Eigen::MatrixXd a = retract(RetractionMode::Eigenvalue, sigma, t, 1e-8);
    const Eigen::MatrixXd b = retract(RetractionMode::Cholesky, sigma, t, 1e-8);
    const Eigen::MatrixXd c = retract(RetractionMode::Exponential, sigma, t, 1e-8);
    EXPECT_TRUE(a.isApprox(sigma + t, 1e-14));
    EXPECT_TRUE(b.isApprox(sigma + t, 1e-14));
    EXPECT_TRUE(c.isApprox(sigma + t, 1e-6));
}

TEST(RetractionTest, NonFiniteInputThrows) {
    Eigen::MatrixXd m = Eigen::MatrixXd::Identity(2, 2);
    m(0, 0) = std::numeric_limits<double>::infinity();
    EXPECT_THROW(retractSPD(m), std::domain_error);
    EXPECT_THROW(retractSPDCholesky(m), std::domain_error);
    EXPECT_THROW(retractSPDExponential(Eigen::MatrixXd::Identity(2, 2), m), std::domain_error);
}
