#include "io/Snapshot.h"
#include "kernel/MultiAgentSystem.h"
#include "modules/FreeEnergy.h"
#include "modules/HamiltonianTrainer.h"
#include "modules/MassMatrix.h"
#include "modules/Metrics.h"
#include "modules/SocialAttention.h"
#include "modules/Trainer.h"
#include "scenario/Presets.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <memory>
#include <vector>
#include <cstdlib>

static void printHelp() {
    std::cerr << "VFE Commands:\n"
              << "  step N             # N natural-gradient steps, print JSON snapshot\n"
              << "  hstep N            # N Hamiltonian (leapfrog) steps\n"
              << "  run T log          # T gradient steps, CSV energy every 'log' steps\n"
              << "  state [cov]        # print JSON snapshot (optional: covariances)\n"
              << "  energy             # free-energy breakdown\n"
              << "  attention          # belief attention matrix beta\n"
              << "  inertia            # epistemic inertia per agent\n"
              << "  metrics            # polarization, entropy, inertia, prior KL\n"
              << "  observe i y1..yK [var]  # attach evidence N(y, var*I) to agent i\n"
              << "  clear              # drop all observations\n"
              << "  reset [preset N]   # rebuild the population\n"
              << "  quit               # exit\n"
              << "\nOptions: --preset=NAME --agents=N --dim=K --seed=S\n"
              << "         --support=full|window[:r]|random[:p], or VFE_PRESET env var\n";
}

struct Session {
    ScenarioKind kind = ScenarioKind::Neutral;
    std::uint32_t agents = 10;
    std::uint32_t dim = 3;
    std::uint64_t seed = 42;
    SupportPatternConfig support;
    std::unique_ptr<MultiAgentSystem> system;
    std::unique_ptr<Trainer> trainer;
    std::unique_ptr<HamiltonianTrainer> hamiltonian;

    void rebuild() {
        SociologyConfig sociology = presetConfig(kind);
        sociology.beliefDimensions = dim;
        sociology.support = support;
        system = std::make_unique<MultiAgentSystem>(makeSystem(buildScenario(kind, sociology, agents, seed)));
        trainer = std::make_unique<Trainer>();
        hamiltonian.reset();
        std::cerr << "Population: " << agents << " agents, K=" << dim
                  << ", scenario=" << scenarioName(kind) << ", seed=" << seed << "\n";
    }
};

static void printEvents(const EventLog& log, std::size_t from) {
    const auto& ev = log.events();
    for (std::size_t i = from; i < ev.size(); ++i) {
        std::cerr << "[event] step " << ev[i].step << " " << eventTypeName(ev[i].type)
                  << " value=" << ev[i].value << " ref=" << ev[i].reference << "\n";
    }
}

static void runCommand(Session& s, const std::string& cmd, std::istringstream& iss) {
    if (cmd == "step") {
        int n = 1;
        iss >> n;
        if (n < 1) n = 1;
        const std::size_t before = s.trainer->eventLog().events().size();
        for (int i = 0; i < n; ++i) {
            s.trainer->step(*s.system);
            if ((i + 1) % 100 == 0 || i == n - 1) {
                std::cerr << "Step " << (i + 1) << "/" << n << "\r";
                std::cerr.flush();
            }
        }
        std::cerr << "\n";
        printEvents(s.trainer->eventLog(), before);
        std::cout << systemToJson(*s.system) << "\n";
        std::cout.flush();

    } else if (cmd == "hstep") {
        int n = 1;
        iss >> n;
        if (n < 1) n = 1;
        if (!s.hamiltonian) {
            s.hamiltonian = std::make_unique<HamiltonianTrainer>(*s.system);
        }
        const std::size_t before = s.hamiltonian->eventLog().events().size();
        s.hamiltonian->run(*s.system, n);
        printEvents(s.hamiltonian->eventLog(), before);
        const auto& h = s.hamiltonian->history();
        std::cerr << std::setprecision(6) << "H=" << h.hamiltonian.back()
                  << " T=" << h.kinetic.back() << " E=" << h.potential.back()
                  << " drift=" << h.maxRelativeDrift() << "\n";
        std::cout << systemToJson(*s.system) << "\n";
        std::cout.flush();

    } else if (cmd == "run") {
        int T = 100, logEvery = 10;
        iss >> T >> logEvery;
        if (logEvery < 1) logEvery = 1;
        logEnergyHeader(std::cout);
        for (int t = 0; t < T; ++t) {
            const FreeEnergyBreakdown e = s.trainer->step(*s.system);
            if (t % logEvery == 0 || t == T - 1) {
                logEnergy(s.trainer->stepCount() - 1, e, std::cout);
            }
        }
        std::cout.flush();

    } else if (cmd == "state") {
        std::string opt;
        iss >> opt;
        std::cout << systemToJson(*s.system, opt == "cov") << "\n";

    } else if (cmd == "energy") {
        const auto e = computeTotalFreeEnergy(*s.system);
        std::cout << std::fixed << std::setprecision(6)
                  << "Total:        " << e.total << "\n"
                  << "  self:       " << e.self << "\n"
                  << "  belief:     " << e.beliefAlign << "\n"
                  << "  prior:      " << e.priorAlign << "\n"
                  << "  observation:" << e.observation << "\n";

    } else if (cmd == "attention") {
        const Eigen::MatrixXd beta = computeSocialInfluenceMatrix(*s.system);
        std::cout << std::fixed << std::setprecision(3) << beta << "\n";

    } else if (cmd == "inertia") {
        const Eigen::VectorXd inertia = computeEpistemicInertia(*s.system);
        std::cout << std::fixed << std::setprecision(4);
        for (Eigen::Index i = 0; i < inertia.size(); ++i) {
            std::cout << "Agent " << i << ": " << inertia[i] << "\n";
        }

    } else if (cmd == "metrics") {
        const SystemMetrics m = computeMetrics(*s.system);
        std::cout << std::fixed << std::setprecision(4)
                  << "Polarization: " << m.polarization << "\n"
                  << "Mean distance: " << m.meanDistance << "\n"
                  << "Mean entropy: " << m.meanEntropy << "\n"
                  << "Mean inertia: " << m.meanInertia << "\n"
                  << "Mean prior KL: " << m.meanPriorKL << "\n";

    } else if (cmd == "observe") {
        std::size_t i = 0;
        if (!(iss >> i)) {
            std::cerr << "Usage: observe i y1..yK [var]\n";
            return;
        }
        const Eigen::Index K = s.system->dim();
        Eigen::VectorXd y(K);
        for (Eigen::Index k = 0; k < K; ++k) {
            if (!(iss >> y[k])) {
                std::cerr << "Usage: observe i y1..yK [var] (need " << K << " values)\n";
                return;
            }
        }
        double var = 0.1;
        iss >> var;
        s.system->setObservation(i, Observation{y, var * Eigen::MatrixXd::Identity(K, K)});
        std::cerr << "Observation attached to agent " << i << "\n";

    } else if (cmd == "clear") {
        s.system->clearObservations();

    } else if (cmd == "reset") {
        std::string name;
        if (iss >> name) {
            s.kind = parseScenario(name);
            std::uint32_t n = 0;
            if (iss >> n && n > 0) s.agents = n;
        }
        s.rebuild();

    } else if (cmd == "help") {
        printHelp();

    } else {
        std::cerr << "Unknown command: " << cmd << "\n";
        printHelp();
    }
}

int main(int argc, char** argv) {
    Session session;

    try {
        if (const char* envPreset = std::getenv("VFE_PRESET")) {
            session.kind = parseScenario(envPreset);
        }

        const char* scriptArg = nullptr;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--preset=", 0) == 0) {
                session.kind = parseScenario(arg.substr(9));
            } else if (arg.rfind("--agents=", 0) == 0) {
                session.agents = static_cast<std::uint32_t>(std::stoul(arg.substr(9)));
            } else if (arg.rfind("--dim=", 0) == 0) {
                session.dim = static_cast<std::uint32_t>(std::stoul(arg.substr(6)));
            } else if (arg.rfind("--support=", 0) == 0) {
                session.support = parseSupportPattern(arg.substr(10));
            } else if (arg.rfind("--seed=", 0) == 0) {
                session.seed = std::stoull(arg.substr(7));
            } else if (arg == "--help" || arg == "-h") {
                printHelp();
                return 0;
            } else if (arg.size() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                return 1;
            } else {
                scriptArg = argv[i];
                break;
            }
        }

        session.rebuild();

        std::istream* input = &std::cin;
        std::ifstream scriptFile;
        if (scriptArg) {
            scriptFile.open(scriptArg);
            if (!scriptFile.is_open()) {
                std::cerr << "Error: Could not open script file '" << scriptArg << "'\n";
                return 1;
            }
            input = &scriptFile;
            std::cerr << "Running commands from script file: " << scriptArg << "\n";
        } else {
            printHelp();
        }

        std::string line;
        while (std::getline(*input, line)) {
            std::istringstream iss(line);
            std::string cmd;
            if (!(iss >> cmd) || cmd[0] == '#') continue;
            if (cmd == "quit") break;
            try {
                runCommand(session, cmd, iss);
            } catch (const std::exception& e) {
                // A failed command leaves the population at its last committed state
                std::cerr << "Error: " << e.what() << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
