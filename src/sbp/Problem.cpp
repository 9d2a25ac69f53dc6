#include "sbp/Problem.h"

#include <stdexcept>
#include <unordered_set>

namespace sbp {

Problem::Problem(ComponentCollection& cc, std::vector<model::ElementBase*> targets, Problem* parent)
    : cc_(cc),
      targets_(std::move(targets)),
      parent_(parent),
      depth_(parent ? parent->depth() + 1 : 0)
{
    for (auto* t : targets_) add(t);
}

void Problem::add(model::ElementBase* e) {
    if (e == nullptr) {
        throw std::runtime_error("Problem::add: null element");
    }
    std::vector<model::ElementBase*> stack{e};
    while (!stack.empty()) {
        model::ElementBase* cur = stack.back();
        stack.pop_back();
        if (cc_.contains(cur)) continue;

        components_.push_back(&cc_.add(cur, this));
        for (auto* a : cur->args()) {
            if (!cc_.contains(a)) stack.push_back(a);
        }
    }
}

Problem* Problem::addNested(std::vector<model::ElementBase*> targets) {
    nested_.push_back(std::make_unique<Problem>(cc_, std::move(targets), this));
    return nested_.back().get();
}

bool Problem::isAncestorOrSelfOf(const Problem* p) const {
    for (; p != nullptr; p = p->parent()) {
        if (p == this) return true;
    }
    return false;
}

std::vector<utils::Factor> Problem::allFactors() const {
    std::vector<utils::Factor> out;
    for (const auto* c : components_) {
        out.insert(out.end(), c->factors.begin(), c->factors.end());
        out.insert(out.end(), c->evidence.begin(), c->evidence.end());
    }
    for (const auto& n : nested_) {
        if (!n->solved) {
            throw std::runtime_error("Problem::allFactors: nested problem solved after its parent");
        }
        out.insert(out.end(), n->solution.begin(), n->solution.end());
    }
    return out;
}

std::vector<utils::VariablePtr> Problem::globals() const {
    std::vector<utils::VariablePtr> out;
    std::unordered_set<int> seen;

    for (auto* t : targets_) {
        auto v = cc_.variable(t);
        if (seen.insert(v->id()).second) out.push_back(v);
    }

    for (const auto& f : allFactors()) {
        for (const auto& v : f.variables()) {
            if (seen.count(v->id())) continue;
            bool outside = !isAncestorOrSelfOf(cc_.ownerOf(*v));
            for (const Problem* user : cc_.usersOf(*v)) {
                outside = outside || !isAncestorOrSelfOf(user);
            }
            if (!outside) continue;
            seen.insert(v->id());
            out.push_back(v);
        }
    }
    return out;
}

} // namespace sbp
