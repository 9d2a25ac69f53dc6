#pragma once
#include <memory>
#include <unordered_map>
#include <vector>

#include "Factor.h"
#include "sbp/FactorNode.h"
#include "sbp/VariableNode.h"

namespace sbp {

// Bipartite graph of discrete variable nodes and factor nodes
class FactorGraph {
public:
    double damping = 0.0;

    std::vector<std::unique_ptr<VariableNode>> var_nodes;
    std::vector<std::unique_ptr<FactorNode>> factors;

    // Returns the existing node if `var` was already added
    VariableNode* addVariable(const utils::VariablePtr& var);
    VariableNode* findVariable(const utils::Variable& var) const;

    // Adds the potential and connects it to the nodes of its variables
    // (created on demand). Factors without variables are ignored: nullptr.
    FactorNode* addFactor(const utils::Factor& potential);

    void connect(FactorNode* f, VariableNode* v, int local_idx);

    // Uniform messages and beliefs everywhere
    void initialize();

    // synchronous iteration: factor messages, then beliefs, then
    // variable-to-factor messages
    // @return max change of any factor-to-variable message entry
    double synchronousIteration();

    // keep factor.adj_messages in sync with the variables
    void syncAllFactorIncoming();

    /**
     * @param iterations  number of synchronous sweeps
     * @param tolerance   > 0: stop once a sweep changes no message by more than this
     * @return sweeps actually performed
     */
    int run(int iterations, double tolerance = 0.0);

    int numVariables() const { return (int)var_nodes.size(); }
    int numFactors() const { return (int)factors.size(); }

private:
    std::unordered_map<int, VariableNode*> by_variable_id_;
};

} // namespace sbp
