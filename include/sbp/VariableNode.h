#pragma once
#include <Eigen/Dense>
#include <vector>

#include "Factor.h"

namespace sbp {

class FactorNode;  // forward declaration

struct AdjFactorRef {
    FactorNode* factor = nullptr;
    int local_idx = -1; // this variable's index in factor->adj_var_nodes
};

class VariableNode {
public:
    int id = -1;           // index in FactorGraph::var_nodes
    int dim = 0;           // range size

    utils::VariablePtr variable;

    // Normalized product of incoming factor messages
    Eigen::VectorXd belief;

    // Adjacency: list of (factor*, local_idx)
    std::vector<AdjFactorRef> adj_factors;

    VariableNode(int id, utils::VariablePtr var);

    // belief = normalize(prod_k factor_k->messages[local_idx])
    void updateBelief();

    // Variable-to-factor message for adj_factors[slot]: product of all other
    // incoming messages, normalized
    void messageTo(int slot, Eigen::VectorXd& out) const;

    // belief as a one-variable factor
    utils::Factor beliefFactor() const;
};

// Divide by the sum; all-zero (or non-finite sum) vectors are left unchanged
void normalizeInPlace(Eigen::VectorXd& v);

} // namespace sbp
