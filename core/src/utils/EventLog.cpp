#include "utils/EventLog.h"

#include <algorithm>

void EventLog::logEnergyIncrease(std::uint64_t step, double previous, double current) {
    events_.push_back({step, EventType::EnergyIncrease, current, previous});
}

void EventLog::logConvergence(std::uint64_t step, double delta) {
    events_.push_back({step, EventType::Converged, delta, 0.0});
}

void EventLog::logRetractionRepair(std::uint64_t step, std::size_t repairedAgents) {
    events_.push_back({step, EventType::RetractionRepair,
                       static_cast<double>(repairedAgents), 0.0});
}

void EventLog::logEnergyDrift(std::uint64_t step, double initial, double current) {
    events_.push_back({step, EventType::EnergyDrift, current, initial});
}

std::size_t EventLog::count(EventType type) const {
    return static_cast<std::size_t>(std::count_if(
        events_.begin(), events_.end(),
        [type](const SimEvent& e) { return e.type == type; }));
}

const char* eventTypeName(EventType type) {
    switch (type) {
        case EventType::EnergyIncrease: return "energy_increase";
        case EventType::Converged: return "converged";
        case EventType::RetractionRepair: return "retraction_repair";
        case EventType::EnergyDrift: return "energy_drift";
        default: return "unknown";
    }
}
