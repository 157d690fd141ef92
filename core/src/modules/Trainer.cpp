#include "modules/Trainer.h"
#include "kernel/MultiAgentSystem.h"
#include "modules/GradientEngine.h"
#include "modules/SocialAttention.h"

#include <cmath>
#include <stdexcept>
#include <string>

std::vector<double> TrainingHistory::totalEnergy() const {
    std::vector<double> out;
    out.reserve(energy.size());
    for (const auto& e : energy) {
        out.push_back(e.total);
    }
    return out;
}

Trainer::Trainer(const TrainingConfig& cfg)
    : cfg_(cfg), applier_(cfg.retraction, cfg.spdEpsilon) {
    cfg_.validate();
}

FreeEnergyBreakdown Trainer::step(MultiAgentSystem& system) {
    // Everything below reads one snapshot; the applier commits all agents together
    const AttentionField field = computeAttention(system);
    const FreeEnergyBreakdown energy = computeTotalFreeEnergy(system, field);
    const std::vector<AgentGradients> grads = computeNaturalGradients(system, field);
    const std::size_t repaired = applier_.apply(system, grads);

    if (!history_.energy.empty()) {
        const double prev = history_.energy.back().total;
        if (energy.total > prev) {
            event_log_.logEnergyIncrease(steps_, prev, energy.total);
        }
    }
    if (repaired > 0) {
        event_log_.logRetractionRepair(steps_, repaired);
    }

    history_.energy.push_back(energy);
    history_.gradNorm.push_back(naturalGradientNorm(grads));
    history_.repairs.push_back(repaired);
    ++steps_;
    return energy;
}

const TrainingHistory& Trainer::run(MultiAgentSystem& system) {
    return run(system, cfg_.nSteps);
}

const TrainingHistory& Trainer::run(MultiAgentSystem& system, int nSteps) {
    if (nSteps < 0) {
        throw std::invalid_argument("nSteps must be >= 0 (got " + std::to_string(nSteps) + ")");
    }
    for (int t = 0; t < nSteps; ++t) {
        step(system);
        const std::size_t n = history_.energy.size();
        if (cfg_.convergenceTol > 0.0 && n >= 2) {
            const double delta = history_.energy[n - 2].total - history_.energy[n - 1].total;
            if (std::abs(delta) < cfg_.convergenceTol) {
                history_.converged = true;
                history_.convergedStep = static_cast<int>(n - 1);
                event_log_.logConvergence(steps_, delta);
                break;
            }
        }
    }
    return history_;
}

void Trainer::reset() {
    history_ = TrainingHistory{};
    event_log_.clear();
    steps_ = 0;
}
