#include "kernel/Config.h"
#include "utils/Validation.h"

#include <stdexcept>
#include <string>

void SupportPatternConfig::validate() const {
    if (pattern == SupportPattern::Random && !(density > 0.0 && density <= 1.0)) {
        throw std::invalid_argument("support density must be in (0, 1] (got " +
                                    std::to_string(density) + ")");
    }
}

void AgentConfig::validate() const {
    if (K == 0) {
        throw std::invalid_argument("belief dimension K must be > 0");
    }
    validation::requireNonNegative(muScale, "muScale");
    validation::requireRange(muOffset, -1e6, 1e6, "muOffset");
    validation::requirePositive(sigmaScale, "sigmaScale");
    validation::requireNonNegative(priorMuScale, "priorMuScale");
    validation::requirePositive(priorSigmaScale, "priorSigmaScale");
    validation::requireNonNegative(lrMu, "lrMu");
    validation::requireNonNegative(lrSigma, "lrSigma");
    validation::requireNonNegative(gaugeScale, "gaugeScale");
    support.validate();
}

void SystemConfig::validate() const {
    validation::requireNonNegative(lambdaSelf, "lambdaSelf");
    validation::requireNonNegative(lambdaBeliefAlign, "lambdaBeliefAlign");
    validation::requireNonNegative(lambdaPriorAlign, "lambdaPriorAlign");
    validation::requirePositive(kappaBeta, "kappaBeta");
    validation::requirePositive(kappaGamma, "kappaGamma");
    validation::requireRange(spdEpsilon, 0.0, 1.0, "spdEpsilon");
}

void CouplingConfig::validate() const {
    if (topology == CouplingTopology::SmallWorld && avgConnections < 2) {
        throw std::invalid_argument("small-world coupling needs avgConnections >= 2 (got " +
                                    std::to_string(avgConnections) + ")");
    }
    validation::requireRange(rewireProb, 0.0, 1.0, "rewireProb");
}

void MassMatrixConfig::validate() const {
    validation::requireNonNegative(regularization, "mass regularization");
}

void TrainingConfig::validate() const {
    if (nSteps < 0) {
        throw std::invalid_argument("nSteps must be >= 0 (got " + std::to_string(nSteps) + ")");
    }
    validation::requireNonNegative(convergenceTol, "convergenceTol");
    validation::requirePositive(spdEpsilon, "spdEpsilon");
    validation::requireRange(spdEpsilon, 0.0, 1.0, "spdEpsilon");
}

void HamiltonianConfig::validate() const {
    if (nSteps < 0) {
        throw std::invalid_argument("nSteps must be >= 0 (got " + std::to_string(nSteps) + ")");
    }
    validation::requirePositive(dt, "dt");
    validation::requireNonNegative(friction, "friction");
    validation::requirePositive(driftTolerance, "driftTolerance");
    validation::requirePositive(spdEpsilon, "spdEpsilon");
    validation::requireRange(spdEpsilon, 0.0, 1.0, "spdEpsilon");
    mass.validate();
}
