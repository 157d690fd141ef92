#include "scenario/Presets.h"
#include "utils/Validation.h"

#include <algorithm>
#include <cctype>
#include <random>
#include <stdexcept>
#include <string>

void SociologyConfig::validate() const {
    if (beliefDimensions < 1) {
        throw std::invalid_argument("beliefDimensions must be >= 1");
    }
    validation::requireNonNegative(initialBeliefSpread, "initialBeliefSpread");
    validation::requireNonNegative(priorStrength, "priorStrength");
    validation::requireNonNegative(socialInfluenceStrength, "socialInfluenceStrength");
    validation::requirePositive(uncertaintyLevel, "uncertaintyLevel");
    validation::requireNonNegative(learningRate, "learningRate");
    validation::requirePositive(temperature, "temperature");
    support.validate();
}

AgentConfig SociologyConfig::toAgentConfig() const {
    AgentConfig cfg;
    cfg.K = beliefDimensions;
    cfg.muScale = initialBeliefSpread;
    cfg.sigmaScale = uncertaintyLevel;
    cfg.lrMu = learningRate;
    cfg.lrSigma = learningRate * 0.1;
    cfg.support = support;
    return cfg;
}

SystemConfig SociologyConfig::toSystemConfig() const {
    SystemConfig cfg;
    cfg.lambdaSelf = 1.0;
    cfg.lambdaBeliefAlign = socialInfluenceStrength;
    cfg.lambdaPriorAlign = priorStrength;
    cfg.kappaBeta = temperature;
    return cfg;
}

SociologyConfig presetConfig(ScenarioKind kind) {
    SociologyConfig c;
    switch (kind) {
        case ScenarioKind::Consensus:
            c.initialBeliefSpread = 0.1;
            c.priorStrength = 0.1;
            c.socialInfluenceStrength = 0.8;
            c.uncertaintyLevel = 0.2;
            break;
        case ScenarioKind::Polarization:
            c.initialBeliefSpread = 1.0;
            c.priorStrength = 0.5;
            c.socialInfluenceStrength = 0.3;
            c.uncertaintyLevel = 0.3;
            break;
        case ScenarioKind::EchoChambers:
            c.initialBeliefSpread = 0.8;
            c.priorStrength = 0.6;
            c.socialInfluenceStrength = 0.2;
            c.uncertaintyLevel = 0.4;
            break;
        case ScenarioKind::ExpertVsNovice:
            c.initialBeliefSpread = 0.3;
            c.priorStrength = 0.4;
            c.socialInfluenceStrength = 0.5;
            c.uncertaintyLevel = 0.5;  // overridden per group
            break;
        case ScenarioKind::Backfire:
            c.initialBeliefSpread = 0.5;
            c.priorStrength = 0.9;
            c.socialInfluenceStrength = 0.1;
            c.uncertaintyLevel = 0.1;
            break;
        case ScenarioKind::Neutral:
            break;
    }
    return c;
}

ScenarioKind parseScenario(const std::string& name) {
    std::string key;
    key.reserve(name.size());
    for (char ch : name) {
        if (ch == '-' || ch == ' ') ch = '_';
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (key == "consensus") return ScenarioKind::Consensus;
    if (key == "polarization") return ScenarioKind::Polarization;
    if (key == "echo_chambers" || key == "echo") return ScenarioKind::EchoChambers;
    if (key == "expert_vs_novice" || key == "experts") return ScenarioKind::ExpertVsNovice;
    if (key == "backfire") return ScenarioKind::Backfire;
    if (key == "neutral") return ScenarioKind::Neutral;
    throw std::invalid_argument("unknown scenario '" + name + "'");
}

const char* scenarioName(ScenarioKind kind) {
    switch (kind) {
        case ScenarioKind::Consensus: return "consensus";
        case ScenarioKind::Polarization: return "polarization";
        case ScenarioKind::EchoChambers: return "echo_chambers";
        case ScenarioKind::ExpertVsNovice: return "expert_vs_novice";
        case ScenarioKind::Backfire: return "backfire";
        case ScenarioKind::Neutral: return "neutral";
    }
    return "unknown";
}

SupportPatternConfig parseSupportPattern(const std::string& text) {
    SupportPatternConfig cfg;
    const std::size_t colon = text.find(':');
    const std::string name = text.substr(0, colon);
    const std::string arg = (colon == std::string::npos) ? std::string() : text.substr(colon + 1);
    if (name == "full") {
        cfg.pattern = SupportPattern::Full;
    } else if (name == "window") {
        cfg.pattern = SupportPattern::Window;
    } else if (name == "random") {
        cfg.pattern = SupportPattern::Random;
    } else {
        throw std::invalid_argument("unknown support pattern '" + text + "'");
    }
    if (!arg.empty()) {
        try {
            if (cfg.pattern == SupportPattern::Window) {
                cfg.radius = static_cast<std::uint32_t>(std::stoul(arg));
            } else if (cfg.pattern == SupportPattern::Random) {
                cfg.density = std::stod(arg);
            }
        } catch (const std::logic_error&) {
            throw std::invalid_argument("bad support pattern argument '" + arg + "'");
        }
    }
    cfg.validate();
    return cfg;
}

namespace {

std::uint32_t echoGroup(std::uint32_t i, std::uint32_t n) {
    return std::min<std::uint32_t>(2, static_cast<std::uint32_t>((3ull * i) / n));
}

MultiAgentSystem::NeighborLists allToAll(std::uint32_t n) {
    MultiAgentSystem::NeighborLists nb(n);
    for (std::uint32_t i = 0; i < n; ++i) {
        for (std::uint32_t j = 0; j < n; ++j) {
            if (j != i) nb[i].push_back(j);
        }
    }
    return nb;
}

}  // namespace

Scenario buildScenario(ScenarioKind kind, std::uint32_t n, std::uint64_t seed, std::uint32_t K) {
    SociologyConfig sociology = presetConfig(kind);
    if (K > 0) sociology.beliefDimensions = K;
    return buildScenario(kind, sociology, n, seed);
}

Scenario buildScenario(ScenarioKind kind, const SociologyConfig& sociology,
                       std::uint32_t n, std::uint64_t seed) {
    if (n < 1) {
        throw std::invalid_argument("scenario needs at least one agent");
    }
    Scenario s;
    s.kind = kind;
    s.sociology = sociology;
    s.sociology.validate();
    s.system = s.sociology.toSystemConfig();

    const AgentConfig base = s.sociology.toAgentConfig();
    const double spread = s.sociology.initialBeliefSpread;
    s.agents.reserve(n);

    for (std::uint32_t i = 0; i < n; ++i) {
        AgentConfig cfg = base;
        switch (kind) {
            case ScenarioKind::Polarization:
                // Two camps, one on each side of the origin
                cfg.muOffset = (i < n / 2) ? spread : -spread;
                cfg.muScale = 0.25 * spread;
                break;
            case ScenarioKind::EchoChambers:
                cfg.muOffset = (static_cast<double>(echoGroup(i, n)) - 1.0) * spread;
                cfg.muScale = 0.25 * spread;
                break;
            case ScenarioKind::ExpertVsNovice:
                cfg.sigmaScale = (5ull * i < n) ? 0.1 : 0.5;
                break;
            default:
                break;
        }

        std::mt19937_64 rng(seed + i);
        Agent a = createAgent(i, cfg, rng);
        if (kind == ScenarioKind::Polarization || kind == ScenarioKind::Backfire) {
            // Each agent is anchored to where it starts
            a.muP = a.muQ;
        }
        s.agents.push_back(std::move(a));
    }

    if (kind == ScenarioKind::EchoChambers) {
        s.neighbors.assign(n, {});
        for (std::uint32_t i = 0; i < n; ++i) {
            for (std::uint32_t j = 0; j < n; ++j) {
                if (j != i && echoGroup(i, n) == echoGroup(j, n)) s.neighbors[i].push_back(j);
            }
        }
    } else {
        s.neighbors = allToAll(n);
    }
    return s;
}

MultiAgentSystem makeSystem(Scenario scenario) {
    return MultiAgentSystem(std::move(scenario.agents), scenario.system, std::move(scenario.neighbors));
}
