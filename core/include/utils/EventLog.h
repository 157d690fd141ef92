#ifndef EVENT_LOG_H
#define EVENT_LOG_H

#include <cstdint>
#include <cstddef>
#include <vector>

// Non-fatal run diagnostics. Integrators record here instead of throwing;
// the caller decides whether an energy increase or drift means stop.
enum class EventType : std::uint8_t {
    EnergyIncrease = 0,
    Converged = 1,
    RetractionRepair = 2,
    EnergyDrift = 3,
    COUNT
};

struct SimEvent {
    std::uint64_t step = 0;
    EventType type = EventType::EnergyIncrease;
    double value = 0.0;
    double reference = 0.0;
};

class EventLog {
public:
    void logEnergyIncrease(std::uint64_t step, double previous, double current);
    void logConvergence(std::uint64_t step, double delta);
    void logRetractionRepair(std::uint64_t step, std::size_t repairedAgents);
    void logEnergyDrift(std::uint64_t step, double initial, double current);

    const std::vector<SimEvent>& events() const { return events_; }
    std::size_t count(EventType type) const;
    void clear() { events_.clear(); }

private:
    std::vector<SimEvent> events_;
};

const char* eventTypeName(EventType type);

#endif
