#ifndef VFE_SNAPSHOT_H
#define VFE_SNAPSHOT_H

#include <cstdint>
#include <iosfwd>
#include <string>
#include "modules/HamiltonianTrainer.h"
#include "modules/Trainer.h"

class MultiAgentSystem;

// JSON export of beliefs. includeCovariance adds covariances, prior means,
// supports and the attention matrix beta.
std::string systemToJson(const MultiAgentSystem& system, bool includeCovariance = false);

std::string historyToJson(const TrainingHistory& history);
std::string historyToJson(const HamiltonianHistory& history);
std::string eventsToJson(const EventLog& log);

// CSV energy logging: step,total,self,beliefAlign,priorAlign,observation
void logEnergyHeader(std::ostream& out);
void logEnergy(std::uint64_t step, const FreeEnergyBreakdown& e, std::ostream& out);

#endif
