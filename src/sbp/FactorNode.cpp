#include "sbp/FactorNode.h"
#include "sbp/VariableNode.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <stdexcept>
#include <string>

namespace sbp {

FactorNode::FactorNode(int id_, utils::Factor potential, const std::vector<VariableNode*>& vars)
    : id(id_),
      adj_var_nodes(vars),
      adj_slots(vars.size(), -1),
      factor(std::move(potential))
{
    if ((int)vars.size() != factor.numVars()) {
        throw std::runtime_error("FactorNode " + std::to_string(id) + ": variable count does not match the potential");
    }
    for (int i = 0; i < (int)vars.size(); ++i) {
        if (vars[i] == nullptr || vars[i]->dim != factor.dims()[i]) {
            throw std::runtime_error("FactorNode " + std::to_string(id) + ": variable node " + std::to_string(i) +
                                     " does not match the potential");
        }
        adj_messages.push_back(Eigen::VectorXd::Constant(vars[i]->dim, 1.0 / vars[i]->dim));
        messages.push_back(Eigen::VectorXd::Constant(vars[i]->dim, 1.0 / vars[i]->dim));
    }
    scratch_ = messages;
}

void FactorNode::syncIncomingFromVariables() {
    for (int i = 0; i < (int)adj_var_nodes.size(); ++i) {
        assert(adj_slots[i] >= 0);
        adj_var_nodes[i]->messageTo(adj_slots[i], adj_messages[i]);
    }
}

double FactorNode::computeMessages(double damping) {
    const int n = (int)adj_var_nodes.size();
    if (n == 0) return 0.0;

    for (int i = 0; i < n; ++i) scratch_[i].setZero();

    // ==== marginalize potential * incoming messages of the other variables ====
    std::vector<int> idx(n, 0);
    const auto& dims = factor.dims();
    for (int flat = 0; flat < factor.size(); ++flat) {
        const double p = factor.entry(flat);
        if (p != 0.0) {
            for (int i = 0; i < n; ++i) {
                double w = p;
                for (int j = 0; j < n; ++j) {
                    if (j != i) w *= adj_messages[j][idx[j]];
                }
                scratch_[i][idx[i]] += w;
            }
        }
        // odometer, last variable fastest
        for (int j = n - 1; j >= 0; --j) {
            if (++idx[j] < dims[j]) break;
            idx[j] = 0;
        }
    }

    double delta = 0.0;
    for (int i = 0; i < n; ++i) {
        normalizeInPlace(scratch_[i]);
        if (damping > 0.0) {
            scratch_[i] = (1.0 - damping) * scratch_[i] + damping * messages[i];
        }
        delta = std::max(delta, (scratch_[i] - messages[i]).cwiseAbs().maxCoeff());
        messages[i] = scratch_[i];
    }
    return delta;
}

utils::Factor FactorNode::beliefFactor() const {
    utils::Factor out(factor);
    const int n = (int)adj_var_nodes.size();
    std::vector<int> idx(n, 0);
    const auto& dims = factor.dims();
    for (int flat = 0; flat < out.size(); ++flat) {
        double w = out.entry(flat);
        for (int j = 0; j < n; ++j) w *= adj_messages[j][idx[j]];
        out.setEntry(flat, w);
        for (int j = n - 1; j >= 0; --j) {
            if (++idx[j] < dims[j]) break;
            idx[j] = 0;
        }
    }
    return out.normalized();
}

} // namespace sbp
