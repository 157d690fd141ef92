#ifndef MANIFOLD_H
#define MANIFOLD_H

#include <cstddef>
#include <cstdint>
#include <vector>

// ---------- Base manifold and support regions ----------
// The base manifold is the set of conceptual coordinates (topics) beliefs
// are defined over; a support region chi(c) in [0,1] says which of them an
// agent holds opinions about. Both are immutable after construction.

enum class TopologyType : std::uint8_t {
    Flat = 0,
    Periodic = 1
};

class BaseManifold {
public:
    explicit BaseManifold(std::uint32_t nCoords = 1, TopologyType topology = TopologyType::Flat);

    std::uint32_t size() const { return n_coords_; }
    TopologyType topology() const { return topology_; }

    // Index distance between two coordinates (wraps on a periodic manifold)
    std::uint32_t distance(std::uint32_t a, std::uint32_t b) const;

private:
    std::uint32_t n_coords_;
    TopologyType topology_;
};

struct SupportRegion {
    std::vector<double> chi;  // one weight per manifold coordinate

    std::vector<std::uint32_t> activeDimensions(double threshold = 0.5) const;
    double coverage() const;  // mean chi
    std::size_t size() const { return chi.size(); }
};

SupportRegion createFullSupport(const BaseManifold& manifold);

// chi = 1 within `radius` of `center`, 0 elsewhere
SupportRegion createWindowSupport(const BaseManifold& manifold, std::uint32_t center, std::uint32_t radius);

// Validates size and weight range; throws std::invalid_argument
void validateSupport(const SupportRegion& support, const BaseManifold& manifold);

// Mean of chi_a(c) * chi_b(c) over the manifold; scales pairwise coupling
double supportOverlap(const SupportRegion& a, const SupportRegion& b);

// Coordinates with positive weight in both regions. Pairwise comparisons
// between two agents are restricted to these.
std::vector<std::uint32_t> sharedDimensions(const SupportRegion& a, const SupportRegion& b);

#endif
