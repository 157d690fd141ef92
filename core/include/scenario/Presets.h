#ifndef SCENARIO_PRESETS_H
#define SCENARIO_PRESETS_H

#include <cstdint>
#include <string>
#include <vector>
#include "kernel/Agent.h"
#include "kernel/Config.h"
#include "kernel/MultiAgentSystem.h"

// ---------- Sociological scenarios ----------
// Named starting conditions built on top of the core. The engine itself has
// no notion of a scenario; these only pick configs, agents and wiring.

enum class ScenarioKind : std::uint8_t {
    Consensus = 0,       // tight start, strong social pull
    Polarization = 1,    // two camps anchored near their own priors
    EchoChambers = 2,    // three groups, influence only within a group
    ExpertVsNovice = 3,  // 20% confident experts, the rest uncertain
    Backfire = 4,        // strong priors, weak social pull
    Neutral = 5
};

struct SociologyConfig {
    std::uint32_t beliefDimensions = 3;
    double initialBeliefSpread = 0.5;
    double priorStrength = 0.3;           // lambdaPriorAlign
    double socialInfluenceStrength = 0.5; // lambdaBeliefAlign
    double uncertaintyLevel = 0.3;        // initial belief std dev
    double learningRate = 0.1;
    double temperature = 1.0;             // kappaBeta
    SupportPatternConfig support;         // topics each agent holds opinions on

    void validate() const;
    AgentConfig toAgentConfig() const;
    SystemConfig toSystemConfig() const;
};

struct Scenario {
    ScenarioKind kind = ScenarioKind::Neutral;
    SociologyConfig sociology;
    std::vector<Agent> agents;
    SystemConfig system;
    MultiAgentSystem::NeighborLists neighbors;  // directed, j in [i] influences i
};

SociologyConfig presetConfig(ScenarioKind kind);

// Case-insensitive; accepts "echo_chambers"/"echo-chambers" style names.
// Throws std::invalid_argument for an unknown name.
ScenarioKind parseScenario(const std::string& name);
const char* scenarioName(ScenarioKind kind);

// Agent i draws from std::mt19937_64(seed + i); groups are assigned by index.
Scenario buildScenario(ScenarioKind kind, std::uint32_t n, std::uint64_t seed,
                       std::uint32_t K = 0);  // K = 0 keeps the preset dimension
// Same wiring and group layout with an explicit configuration
Scenario buildScenario(ScenarioKind kind, const SociologyConfig& sociology,
                       std::uint32_t n, std::uint64_t seed);

// "full", "window[:radius]" or "random[:density]"; throws std::invalid_argument
SupportPatternConfig parseSupportPattern(const std::string& text);

MultiAgentSystem makeSystem(Scenario scenario);

#endif
