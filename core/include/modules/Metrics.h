#ifndef METRICS_H
#define METRICS_H

#include "kernel/Config.h"

class MultiAgentSystem;

// Population-level summary of the current beliefs
struct SystemMetrics {
    double polarization = 0.0;     // var / mean of pairwise belief-mean distances
    double meanDistance = 0.0;     // mean pairwise distance between belief means
    double meanEntropy = 0.0;      // average differential entropy of q_i
    double meanInertia = 0.0;      // average trace(M_i)/K
    double meanPriorKL = 0.0;      // average KL(q_i || p_i)
};

// Clustered opinions give a high distance variance relative to the mean;
// fewer than two agents gives 0.
double computePolarization(const MultiAgentSystem& system);

SystemMetrics computeMetrics(const MultiAgentSystem& system, const MassMatrixConfig& mass = {});

#endif
