#ifndef GRADIENT_APPLIER_H
#define GRADIENT_APPLIER_H

#include <cstddef>
#include <vector>
#include "kernel/Config.h"
#include "modules/GradientEngine.h"

class MultiAgentSystem;

/**
 * Applies one natural-gradient step to every agent:
 *   mu_q    <- mu_q - lrMu * natGradMu
 *   Sigma_q <- retract(Sigma_q - lrSigma * natGradSigma)
 *
 * All proposals are built and retracted before the system is touched; a
 * retraction failure throws and leaves every agent at its previous state.
 */
class GradientApplier {
public:
    explicit GradientApplier(RetractionMode mode = RetractionMode::Cholesky, double eps = 1e-8);

    // Returns the number of covariances the retraction had to repair
    std::size_t apply(MultiAgentSystem& system, const std::vector<AgentGradients>& grads) const;

    RetractionMode mode() const { return mode_; }
    double epsilon() const { return eps_; }

private:
    RetractionMode mode_;
    double eps_;
};

#endif
