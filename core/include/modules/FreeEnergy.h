#ifndef FREE_ENERGY_H
#define FREE_ENERGY_H

#include "modules/SocialAttention.h"

class MultiAgentSystem;

/**
 * Variational free energy and its four terms.
 *
 * The terms are reported unweighted and are each >= 0:
 *   self        sum_i KL(q_i || p_i)
 *   beliefAlign sum_i sum_j chi_ij beta_ij  KL(q_i || Omega_ij q_j)
 *   priorAlign  sum_i sum_j chi_ij gamma_ij KL(q_i || Omega_ij p_j)
 *   observation sum_i KL(q_i || N(y_i, R_i))   (agents with evidence only)
 * total = lambdaSelf*self + lambdaBeliefAlign*beliefAlign
 *       + lambdaPriorAlign*priorAlign + observation
 */
struct FreeEnergyBreakdown {
    double self = 0.0;
    double beliefAlign = 0.0;
    double priorAlign = 0.0;
    double observation = 0.0;
    double total = 0.0;
};

double computeSelfEnergy(const MultiAgentSystem& system, const AttentionField& field);
double computeBeliefAlignmentEnergy(const MultiAgentSystem& system, const AttentionField& field);
double computePriorAlignmentEnergy(const MultiAgentSystem& system, const AttentionField& field);
double computeObservationEnergy(const MultiAgentSystem& system, const AttentionField& field);

FreeEnergyBreakdown computeTotalFreeEnergy(const MultiAgentSystem& system, const AttentionField& field);
FreeEnergyBreakdown computeTotalFreeEnergy(const MultiAgentSystem& system);

#endif
