#include "modules/GradientApplier.h"
#include "kernel/MultiAgentSystem.h"
#include "modules/Retraction.h"
#include "utils/Validation.h"

#include <stdexcept>
#include <string>

GradientApplier::GradientApplier(RetractionMode mode, double eps) : mode_(mode), eps_(eps) {
    validation::requirePositive(eps, "retraction epsilon");
}

std::size_t GradientApplier::apply(MultiAgentSystem& system, const std::vector<AgentGradients>& grads) const {
    if (grads.size() != system.size()) {
        throw std::invalid_argument("gradient count " + std::to_string(grads.size()) +
                                    " does not match population " + std::to_string(system.size()));
    }

    std::vector<Gaussian> proposals(system.size());
    std::size_t repaired = 0;
    for (std::size_t i = 0; i < system.size(); ++i) {
        const Agent& a = system.agent(i);
        const AgentGradients& g = grads[i];
        proposals[i].mu = a.muQ - a.lrMu * g.natGradMu;

        const Eigen::MatrixXd tangent = -a.lrSigma * g.natGradSigma;
        if (mode_ != RetractionMode::Exponential && needsRepair(a.sigmaQ + tangent, eps_)) {
            ++repaired;
        }
        proposals[i].sigma = retract(mode_, a.sigmaQ, tangent, eps_);
    }

    system.commitBeliefs(proposals);
    return repaired;
}
