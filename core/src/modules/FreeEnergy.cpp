#include "modules/FreeEnergy.h"
#include "kernel/MultiAgentSystem.h"
#include "utils/Validation.h"

namespace {

// sum_ij chi_ij w_ij kl_ij
double weightedAlignment(const Eigen::MatrixXd& coupling,
                         const Eigen::MatrixXd& weights,
                         const Eigen::MatrixXd& kl) {
    return coupling.cwiseProduct(weights).cwiseProduct(kl).sum();
}

}

double computeSelfEnergy(const MultiAgentSystem& system, const AttentionField& field) {
    double e = 0.0;
    for (std::size_t i = 0; i < system.size(); ++i) {
        e += klGaussian(field.beliefs[i], field.priors[i]);
    }
    return e;
}

double computeBeliefAlignmentEnergy(const MultiAgentSystem& system, const AttentionField& field) {
    return weightedAlignment(system.couplingMatrix(), field.beta, field.klBelief);
}

double computePriorAlignmentEnergy(const MultiAgentSystem& system, const AttentionField& field) {
    return weightedAlignment(system.couplingMatrix(), field.gamma, field.klPrior);
}

double computeObservationEnergy(const MultiAgentSystem& system, const AttentionField& field) {
    double e = 0.0;
    for (std::size_t i = 0; i < system.size(); ++i) {
        const auto& obs = system.agent(i).observation;
        if (!obs) continue;
        e += klGaussian(field.beliefs[i], precompute(obs->y, obs->covariance));
    }
    return e;
}

FreeEnergyBreakdown computeTotalFreeEnergy(const MultiAgentSystem& system, const AttentionField& field) {
    const SystemConfig& cfg = system.config();
    FreeEnergyBreakdown out;
    out.self = computeSelfEnergy(system, field);
    out.beliefAlign = computeBeliefAlignmentEnergy(system, field);
    out.priorAlign = computePriorAlignmentEnergy(system, field);
    out.observation = computeObservationEnergy(system, field);
    out.total = cfg.lambdaSelf * out.self
              + cfg.lambdaBeliefAlign * out.beliefAlign
              + cfg.lambdaPriorAlign * out.priorAlign
              + out.observation;
    validation::checkFinite(out.total, "free energy");
    return out;
}

FreeEnergyBreakdown computeTotalFreeEnergy(const MultiAgentSystem& system) {
    return computeTotalFreeEnergy(system, computeAttention(system));
}
