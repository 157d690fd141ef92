#ifndef VALIDATION_H
#define VALIDATION_H

#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>
#include <string>

// Numeric-domain checks shared by the engine. All of them throw
// std::domain_error: a non-finite or non-SPD state is never allowed to flow
// into the next KL / Fisher computation.
namespace validation {

inline void checkFinite(double value, const char* what) {
    if (!std::isfinite(value)) {
        throw std::domain_error(std::string(what) + " is not finite");
    }
}

template <typename Derived>
void checkFinite(const Eigen::MatrixBase<Derived>& m, const char* what) {
    if (!m.allFinite()) {
        throw std::domain_error(std::string(what) + " contains NaN or Inf");
    }
}

inline void checkNonNegative(double value, const char* what) {
    checkFinite(value, what);
    if (value < 0.0) {
        throw std::domain_error(std::string(what) + " must be >= 0 (got " +
                                std::to_string(value) + ")");
    }
}

inline void checkPositive(double value, const char* what) {
    checkFinite(value, what);
    if (value <= 0.0) {
        throw std::domain_error(std::string(what) + " must be > 0 (got " +
                                std::to_string(value) + ")");
    }
}

template <typename Derived>
void checkSquare(const Eigen::MatrixBase<Derived>& m, Eigen::Index k, const char* what) {
    if (m.rows() != k || m.cols() != k) {
        throw std::invalid_argument(std::string(what) + " must be " + std::to_string(k) +
                                    "x" + std::to_string(k) + " (got " +
                                    std::to_string(m.rows()) + "x" +
                                    std::to_string(m.cols()) + ")");
    }
}

template <typename Derived>
void checkLength(const Eigen::MatrixBase<Derived>& v, Eigen::Index k, const char* what) {
    if (v.size() != k) {
        throw std::invalid_argument(std::string(what) + " must have length " +
                                    std::to_string(k) + " (got " +
                                    std::to_string(v.size()) + ")");
    }
}

// Configuration range check (construction time)
inline void requireRange(double value, double lo, double hi, const char* what) {
    if (!std::isfinite(value) || value < lo || value > hi) {
        throw std::invalid_argument(std::string(what) + " must be in [" + std::to_string(lo) +
                                    ", " + std::to_string(hi) + "] (got " +
                                    std::to_string(value) + ")");
    }
}

inline void requirePositive(double value, const char* what) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw std::invalid_argument(std::string(what) + " must be > 0 (got " +
                                    std::to_string(value) + ")");
    }
}

inline void requireNonNegative(double value, const char* what) {
    if (!std::isfinite(value) || value < 0.0) {
        throw std::invalid_argument(std::string(what) + " must be >= 0 (got " +
                                    std::to_string(value) + ")");
    }
}

} // namespace validation

#endif
