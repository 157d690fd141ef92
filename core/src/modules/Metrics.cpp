#include "modules/Metrics.h"
#include "geometry/Gaussian.h"
#include "kernel/MultiAgentSystem.h"
#include "modules/MassMatrix.h"

#include <vector>

namespace {

std::vector<double> pairwiseDistances(const MultiAgentSystem& system) {
    std::vector<double> d;
    const std::size_t n = system.size();
    d.reserve(n * (n - 1) / 2);
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            d.push_back((system.agent(i).muQ - system.agent(j).muQ).norm());
        }
    }
    return d;
}

}  // namespace

double computePolarization(const MultiAgentSystem& system) {
    const auto d = pairwiseDistances(system);
    if (d.empty()) return 0.0;

    double mean = 0.0;
    for (double x : d) mean += x;
    mean /= static_cast<double>(d.size());

    double var = 0.0;
    for (double x : d) var += (x - mean) * (x - mean);
    var /= static_cast<double>(d.size());

    return var / (mean + 1e-8);
}

SystemMetrics computeMetrics(const MultiAgentSystem& system, const MassMatrixConfig& mass) {
    SystemMetrics m;
    const double n = static_cast<double>(system.size());

    m.polarization = computePolarization(system);
    const auto d = pairwiseDistances(system);
    if (!d.empty()) {
        for (double x : d) m.meanDistance += x;
        m.meanDistance /= static_cast<double>(d.size());
    }

    for (const auto& a : system.agents()) {
        m.meanEntropy += entropyGaussian(a.belief());
        m.meanPriorKL += klGaussian(a.belief(), a.prior());
    }
    m.meanEntropy /= n;
    m.meanPriorKL /= n;

    m.meanInertia = computeEpistemicInertia(system, mass).mean();
    return m;
}
