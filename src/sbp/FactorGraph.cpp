#include "sbp/FactorGraph.h"

#include <algorithm>
#include <cassert>

namespace sbp {

VariableNode* FactorGraph::addVariable(const utils::VariablePtr& var) {
    if (VariableNode* v = findVariable(*var)) return v;
    const int id = (int)var_nodes.size();
    var_nodes.push_back(std::make_unique<VariableNode>(id, var));
    by_variable_id_[var->id()] = var_nodes.back().get();
    return var_nodes.back().get();
}

VariableNode* FactorGraph::findVariable(const utils::Variable& var) const {
    auto it = by_variable_id_.find(var.id());
    return it == by_variable_id_.end() ? nullptr : it->second;
}

FactorNode* FactorGraph::addFactor(const utils::Factor& potential) {
    if (potential.numVars() == 0) return nullptr;

    std::vector<VariableNode*> vars;
    vars.reserve(potential.numVars());
    for (const auto& v : potential.variables()) vars.push_back(addVariable(v));

    const int id = (int)factors.size();
    factors.push_back(std::make_unique<FactorNode>(id, potential, vars));
    FactorNode* f = factors.back().get();
    for (int i = 0; i < (int)vars.size(); ++i) connect(f, vars[i], i);
    return f;
}

void FactorGraph::connect(FactorNode* f, VariableNode* v, int local_idx) {
    assert(f && v);
    f->adj_slots[local_idx] = (int)v->adj_factors.size();
    v->adj_factors.push_back(AdjFactorRef{f, local_idx});
}

void FactorGraph::initialize() {
    for (auto& f : factors) {
        for (int i = 0; i < (int)f->adj_var_nodes.size(); ++i) {
            const int d = f->adj_var_nodes[i]->dim;
            f->messages[i].setConstant(d, 1.0 / d);
            f->adj_messages[i].setConstant(d, 1.0 / d);
        }
    }
    for (auto& v : var_nodes) v->belief.setConstant(v->dim, 1.0 / v->dim);
}

void FactorGraph::syncAllFactorIncoming() {
    #pragma omp parallel for
    for (int i = 0; i < (int)factors.size(); ++i) {
        factors[i]->syncIncomingFromVariables();
    }
}

double FactorGraph::synchronousIteration() {
    double delta = 0.0;

    // 1) factor messages
    #pragma omp parallel for reduction(max:delta)
    for (int i = 0; i < (int)factors.size(); ++i) {
        delta = std::max(delta, factors[i]->computeMessages(damping));
    }

    // 2) variable beliefs
    #pragma omp parallel for
    for (int i = 0; i < (int)var_nodes.size(); ++i) {
        var_nodes[i]->updateBelief();
    }

    // 3) variables send messages to factors
    syncAllFactorIncoming();
    return delta;
}

int FactorGraph::run(int iterations, double tolerance) {
    int it = 0;
    while (it < iterations) {
        const double delta = synchronousIteration();
        ++it;
        if (tolerance > 0.0 && delta < tolerance) break;
    }
    return it;
}

} // namespace sbp
