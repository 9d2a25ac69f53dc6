#include "sbp/ComponentCollection.h"

#include <algorithm>
#include <stdexcept>

namespace sbp {

ProblemComponent& ComponentCollection::add(model::ElementBase* e, Problem* owner) {
    if (e == nullptr) {
        throw std::runtime_error("ComponentCollection::add: null element");
    }
    auto& slot = components_[e];
    if (slot) {
        throw std::runtime_error("ComponentCollection::add: " + e->name() + " is already registered");
    }
    slot = std::make_unique<ProblemComponent>();
    slot->element = e;
    slot->problem = owner;
    return *slot;
}

ProblemComponent& ComponentCollection::operator()(const model::ElementBase* e) {
    auto it = components_.find(e);
    if (it == components_.end()) {
        throw std::runtime_error("ComponentCollection: element " + (e ? e->name() : std::string("<null>")) +
                                 " is not registered");
    }
    return *it->second;
}

const ProblemComponent& ComponentCollection::operator()(const model::ElementBase* e) const {
    return const_cast<ComponentCollection&>(*this)(e);
}

utils::VariablePtr ComponentCollection::variable(const model::ElementBase* e) const {
    const ProblemComponent& c = (*this)(e);
    if (!c.variable) {
        throw std::runtime_error("ComponentCollection::variable: variable of " + e->name() + " not generated yet");
    }
    return c.variable;
}

void ComponentCollection::setVariable(ProblemComponent& c, utils::VariablePtr v) {
    if (!v) {
        throw std::runtime_error("ComponentCollection::setVariable: null variable for " + c.element->name());
    }
    if (c.variable) by_variable_.erase(c.variable->id());
    by_variable_[v->id()] = &c;
    c.variable = std::move(v);
}

Problem* ComponentCollection::ownerOf(const utils::Variable& var) const {
    auto it = by_variable_.find(var.id());
    return it == by_variable_.end() ? nullptr : it->second->problem;
}

void ComponentCollection::addUse(const utils::Variable& var, const Problem* user) {
    auto& users = users_[var.id()];
    if (std::find(users.begin(), users.end(), user) == users.end()) users.push_back(user);
}

const std::vector<const Problem*>& ComponentCollection::usersOf(const utils::Variable& var) const {
    static const std::vector<const Problem*> kNone;
    auto it = users_.find(var.id());
    return it == users_.end() ? kNone : it->second;
}

} // namespace sbp
