#pragma once
#include <Eigen/Dense>
#include <vector>

#include "Factor.h"

namespace sbp {

class VariableNode;

class FactorNode {
public:
    int id = -1;           // index in FactorGraph::factors

    std::vector<VariableNode*> adj_var_nodes;   // one per factor variable, same order

    // Slot of this factor in adj_var_nodes[i]->adj_factors
    std::vector<int> adj_slots;

    // Incoming variable-to-factor messages (same size as adj_var_nodes)
    std::vector<Eigen::VectorXd> adj_messages;

    // Outgoing factor-to-variable messages (same size as adj_var_nodes)
    std::vector<Eigen::VectorXd> messages;

    // Potential over the adjacent variables
    utils::Factor factor;

    FactorNode(int id, utils::Factor potential, const std::vector<VariableNode*>& vars);

    // Pull adj_messages from the adjacent variables
    void syncIncomingFromVariables();

    // Sum-product kernel: recompute every outgoing message, normalize and damp.
    // Only writes this factor's own messages.
    // @return max absolute change over all outgoing message entries
    double computeMessages(double damping);

    // Potential times every incoming message, normalized
    utils::Factor beliefFactor() const;

private:
    std::vector<Eigen::VectorXd> scratch_;
};

} // namespace sbp
