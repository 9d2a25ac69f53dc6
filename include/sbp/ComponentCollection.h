#pragma once
#include <memory>
#include <unordered_map>
#include <vector>

#include "Factor.h"
#include "model/Element.h"

namespace sbp {

class Problem;

// Per-run state of one element
struct ProblemComponent {
    model::ElementBase* element = nullptr;
    Problem* problem = nullptr;            // owning problem
    utils::VariablePtr variable;           // null until expansion
    std::vector<utils::Factor> factors;    // element factors
    std::vector<utils::Factor> evidence;   // observation / constraint factors
    std::vector<model::ElementBase*> results; // chain results
    bool expanded = false;                 // chain results collected
};

/**
 * Registry from element to its component. Every element is registered at
 * most once per run, in exactly one problem.
 */
class ComponentCollection : public model::VariableLookup {
public:
    ComponentCollection() = default;
    ComponentCollection(const ComponentCollection&) = delete;
    ComponentCollection& operator=(const ComponentCollection&) = delete;

    bool contains(const model::ElementBase* e) const { return components_.count(e) != 0; }

    // Throws std::runtime_error if `e` is already registered
    ProblemComponent& add(model::ElementBase* e, Problem* owner);

    // Throws std::runtime_error if `e` is not registered
    ProblemComponent& operator()(const model::ElementBase* e);
    const ProblemComponent& operator()(const model::ElementBase* e) const;

    // Variable of `e` (componentFor(e).variable); throws if not generated yet
    utils::VariablePtr variable(const model::ElementBase* e) const;
    utils::VariablePtr variableOf(const model::ElementBase& e) const override { return variable(&e); }

    void setVariable(ProblemComponent& c, utils::VariablePtr v);

    // Problem owning the component whose variable is `var`, nullptr if none
    Problem* ownerOf(const utils::Variable& var) const;

    // Problems whose own element or evidence factors mention `var`
    void addUse(const utils::Variable& var, const Problem* user);
    const std::vector<const Problem*>& usersOf(const utils::Variable& var) const;

    int size() const { return (int)components_.size(); }

private:
    std::unordered_map<const model::ElementBase*, std::unique_ptr<ProblemComponent>> components_;
    std::unordered_map<int, ProblemComponent*> by_variable_;
    std::unordered_map<int, std::vector<const Problem*>> users_;
};

} // namespace sbp
