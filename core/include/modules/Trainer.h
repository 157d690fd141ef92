#ifndef TRAINER_H
#define TRAINER_H

#include <cstddef>
#include <cstdint>
#include <vector>
#include "kernel/Config.h"
#include "modules/FreeEnergy.h"
#include "modules/GradientApplier.h"
#include "utils/EventLog.h"

class MultiAgentSystem;

// Append-only per-step diagnostics; entry t describes the state before step t's update
struct TrainingHistory {
    std::vector<FreeEnergyBreakdown> energy;
    std::vector<double> gradNorm;        // Fisher norm of the full gradient
    std::vector<std::size_t> repairs;    // covariances repaired by retraction
    bool converged = false;
    int convergedStep = -1;

    std::size_t size() const { return energy.size(); }
    std::vector<double> totalEnergy() const;
};

/**
 * Overdamped dynamics: natural-gradient flow with no momentum.
 *
 * step(): snapshot -> free energy + breakdown -> natural gradients ->
 * GradientApplier (retraction, synchronous commit) -> history.
 * run() stops after the step budget or once |E_{t-1} - E_t| < convergenceTol.
 * An energy increase is logged, not raised.
 */
class Trainer {
public:
    explicit Trainer(const TrainingConfig& cfg = {});

    FreeEnergyBreakdown step(MultiAgentSystem& system);
    const TrainingHistory& run(MultiAgentSystem& system);
    const TrainingHistory& run(MultiAgentSystem& system, int nSteps);

    const TrainingHistory& history() const { return history_; }
    const EventLog& eventLog() const { return event_log_; }
    const TrainingConfig& config() const { return cfg_; }
    std::uint64_t stepCount() const { return steps_; }
    void reset();

private:
    TrainingConfig cfg_;
    GradientApplier applier_;
    TrainingHistory history_;
    EventLog event_log_;
    std::uint64_t steps_ = 0;
};

#endif
