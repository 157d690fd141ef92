#include "io/Snapshot.h"
#include "kernel/MultiAgentSystem.h"
#include "modules/Metrics.h"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace {

void writeVector(std::ostream& os, const Eigen::VectorXd& v) {
    os << "[";
    for (Eigen::Index k = 0; k < v.size(); ++k) {
        os << v[k];
        if (k + 1 < v.size()) os << ",";
    }
    os << "]";
}

void writeMatrix(std::ostream& os, const Eigen::MatrixXd& m) {
    os << "[";
    for (Eigen::Index r = 0; r < m.rows(); ++r) {
        writeVector(os, m.row(r).transpose());
        if (r + 1 < m.rows()) os << ",";
    }
    os << "]";
}

void writeBreakdown(std::ostream& os, const FreeEnergyBreakdown& e) {
    os << "{\"total\":" << e.total
       << ",\"self\":" << e.self
       << ",\"beliefAlign\":" << e.beliefAlign
       << ",\"priorAlign\":" << e.priorAlign
       << ",\"observation\":" << e.observation << "}";
}

template <typename T>
void writeSeries(std::ostream& os, const std::vector<T>& xs) {
    os << "[";
    for (std::size_t i = 0; i < xs.size(); ++i) {
        os << xs[i];
        if (i + 1 < xs.size()) os << ",";
    }
    os << "]";
}

}  // namespace

std::string systemToJson(const MultiAgentSystem& system, bool includeCovariance) {
    std::ostringstream os;
    os << std::setprecision(6);

    const SystemMetrics m = computeMetrics(system);
    const AttentionField field = computeAttention(system);
    os << "{";
    os << "\"agents\":" << system.size() << ",\"dim\":" << system.dim() << ",";
    os << "\"metrics\":{";
    os << "\"polarization\":" << m.polarization << ",";
    os << "\"meanDistance\":" << m.meanDistance << ",";
    os << "\"meanEntropy\":" << m.meanEntropy << ",";
    os << "\"meanInertia\":" << m.meanInertia << ",";
    os << "\"meanPriorKL\":" << m.meanPriorKL;
    os << "},";
    os << "\"energy\":";
    writeBreakdown(os, computeTotalFreeEnergy(system, field));
    os << ",";

    os << "\"beliefs\":[";
    for (std::size_t i = 0; i < system.size(); ++i) {
        const Agent& a = system.agent(i);
        os << "{\"id\":" << a.id << ",\"mu\":";
        writeVector(os, a.muQ);
        if (includeCovariance) {
            os << ",\"sigma\":";
            writeMatrix(os, a.sigmaQ);
            os << ",\"priorMu\":";
            writeVector(os, a.muP);
            os << ",\"support\":";
            writeSeries(os, a.support.chi);
        }
        if (a.observation) {
            os << ",\"observation\":";
            writeVector(os, a.observation->y);
        }
        os << "}";
        if (i + 1 < system.size()) os << ",";
    }
    os << "]";
    if (includeCovariance) {
        os << ",\"attention\":";
        writeMatrix(os, field.beta);
    }
    os << "}";
    return os.str();
}

std::string historyToJson(const TrainingHistory& history) {
    std::ostringstream os;
    os << std::setprecision(8);
    os << "{\"steps\":" << history.size() << ",";
    os << "\"converged\":" << (history.converged ? "true" : "false") << ",";
    os << "\"convergedStep\":" << history.convergedStep << ",";
    os << "\"total\":";
    writeSeries(os, history.totalEnergy());
    os << ",\"gradNorm\":";
    writeSeries(os, history.gradNorm);
    os << ",\"repairs\":";
    writeSeries(os, history.repairs);
    os << ",\"breakdown\":[";
    for (std::size_t t = 0; t < history.energy.size(); ++t) {
        writeBreakdown(os, history.energy[t]);
        if (t + 1 < history.energy.size()) os << ",";
    }
    os << "]}";
    return os.str();
}

std::string historyToJson(const HamiltonianHistory& history) {
    std::ostringstream os;
    os << std::setprecision(8);
    os << "{\"steps\":" << history.size() << ",";
    os << "\"initialHamiltonian\":" << history.initialHamiltonian << ",";
    os << "\"maxRelativeDrift\":" << history.maxRelativeDrift() << ",";
    os << "\"kinetic\":";
    writeSeries(os, history.kinetic);
    os << ",\"potential\":";
    writeSeries(os, history.potential);
    os << ",\"hamiltonian\":";
    writeSeries(os, history.hamiltonian);
    os << ",\"repairs\":";
    writeSeries(os, history.repairs);
    os << "}";
    return os.str();
}

std::string eventsToJson(const EventLog& log) {
    std::ostringstream os;
    os << std::setprecision(8);
    os << "[";
    const auto& ev = log.events();
    for (std::size_t i = 0; i < ev.size(); ++i) {
        os << "{\"step\":" << ev[i].step
           << ",\"type\":\"" << eventTypeName(ev[i].type) << "\""
           << ",\"value\":" << ev[i].value
           << ",\"reference\":" << ev[i].reference << "}";
        if (i + 1 < ev.size()) os << ",";
    }
    os << "]";
    return os.str();
}

void logEnergyHeader(std::ostream& out) {
    out << "step,total,self,beliefAlign,priorAlign,observation\n";
}

void logEnergy(std::uint64_t step, const FreeEnergyBreakdown& e, std::ostream& out) {
    out << step << ","
        << e.total << ","
        << e.self << ","
        << e.beliefAlign << ","
        << e.priorAlign << ","
        << e.observation << "\n";
}
