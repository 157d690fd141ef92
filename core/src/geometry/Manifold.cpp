#include "geometry/Manifold.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

BaseManifold::BaseManifold(std::uint32_t nCoords, TopologyType topology)
    : n_coords_(nCoords), topology_(topology) {
    if (nCoords == 0) {
        throw std::invalid_argument("base manifold needs at least one coordinate");
    }
}

std::uint32_t BaseManifold::distance(std::uint32_t a, std::uint32_t b) const {
    const std::uint32_t d = a > b ? a - b : b - a;
    if (topology_ == TopologyType::Periodic) {
        return std::min(d, n_coords_ - d);
    }
    return d;
}

std::vector<std::uint32_t> SupportRegion::activeDimensions(double threshold) const {
    std::vector<std::uint32_t> active;
    for (std::size_t c = 0; c < chi.size(); ++c) {
        if (chi[c] > threshold) {
            active.push_back(static_cast<std::uint32_t>(c));
        }
    }
    return active;
}

double SupportRegion::coverage() const {
    if (chi.empty()) return 0.0;
    return std::accumulate(chi.begin(), chi.end(), 0.0) / static_cast<double>(chi.size());
}

SupportRegion createFullSupport(const BaseManifold& manifold) {
    SupportRegion s;
    s.chi.assign(manifold.size(), 1.0);
    return s;
}

SupportRegion createWindowSupport(const BaseManifold& manifold, std::uint32_t center, std::uint32_t radius) {
    if (center >= manifold.size()) {
        throw std::invalid_argument("support center " + std::to_string(center) +
                                    " outside manifold of size " + std::to_string(manifold.size()));
    }
    SupportRegion s;
    s.chi.assign(manifold.size(), 0.0);
    for (std::uint32_t c = 0; c < manifold.size(); ++c) {
        if (manifold.distance(c, center) <= radius) {
            s.chi[c] = 1.0;
        }
    }
    return s;
}

void validateSupport(const SupportRegion& support, const BaseManifold& manifold) {
    if (support.chi.size() != manifold.size()) {
        throw std::invalid_argument("support region has " + std::to_string(support.chi.size()) +
                                    " weights, manifold has " + std::to_string(manifold.size()) +
                                    " coordinates");
    }
    for (double w : support.chi) {
        if (!std::isfinite(w) || w < 0.0 || w > 1.0) {
            throw std::invalid_argument("support weight must be in [0, 1] (got " +
                                        std::to_string(w) + ")");
        }
    }
}

double supportOverlap(const SupportRegion& a, const SupportRegion& b) {
    const std::size_t n = std::min(a.chi.size(), b.chi.size());
    if (n == 0) return 0.0;
    double sum = 0.0;
    for (std::size_t c = 0; c < n; ++c) {
        sum += a.chi[c] * b.chi[c];
    }
    return sum / static_cast<double>(n);
}

std::vector<std::uint32_t> sharedDimensions(const SupportRegion& a, const SupportRegion& b) {
    const std::size_t n = std::min(a.chi.size(), b.chi.size());
    std::vector<std::uint32_t> shared;
    for (std::size_t c = 0; c < n; ++c) {
        if (a.chi[c] > 0.0 && b.chi[c] > 0.0) {
            shared.push_back(static_cast<std::uint32_t>(c));
        }
    }
    return shared;
}
