#include "sbp/VariableNode.h"
#include "sbp/FactorNode.h"

#include <cassert>
#include <cmath>
#include <stdexcept>
#include <string>

namespace sbp {

void normalizeInPlace(Eigen::VectorXd& v) {
    const double z = v.sum();
    if (z > 0.0 && std::isfinite(z)) v /= z;
}

VariableNode::VariableNode(int id_, utils::VariablePtr var)
    : id(id_),
      dim(var ? var->size() : 0),
      variable(std::move(var))
{
    if (!variable) {
        throw std::runtime_error("VariableNode " + std::to_string(id) + ": null variable");
    }
    belief = Eigen::VectorXd::Constant(dim, 1.0 / dim);
}

void VariableNode::updateBelief() {
    belief.setOnes(dim);
    for (const auto& aref : adj_factors) {
        const FactorNode* f = aref.factor;
        const int k = aref.local_idx;

        assert(f != nullptr);
        assert(k >= 0 && k < (int)f->messages.size());

        belief.array() *= f->messages[k].array();
    }
    normalizeInPlace(belief);
}

void VariableNode::messageTo(int slot, Eigen::VectorXd& out) const {
    out.setOnes(dim);
    for (int s = 0; s < (int)adj_factors.size(); ++s) {
        if (s == slot) continue;
        const FactorNode* f = adj_factors[s].factor;
        out.array() *= f->messages[adj_factors[s].local_idx].array();
    }
    normalizeInPlace(out);
}

utils::Factor VariableNode::beliefFactor() const {
    utils::Factor f({variable}, 0.0);
    f.tableRef() = belief;
    return f;
}

} // namespace sbp
