#pragma once
#include <memory>
#include <vector>

#include "Factor.h"
#include "sbp/ComponentCollection.h"

namespace sbp {

/**
 * Node of the decomposition tree.
 *
 * A problem owns the components registered in it and, strictly, its nested
 * problems. After solving, `solution` holds factors over the problem's
 * globals only.
 */
class Problem {
public:
    /**
     * @param cc       registry shared by the whole tree
     * @param targets  elements whose variables the solution must preserve
     * @param parent   enclosing problem (nullptr for the root)
     */
    Problem(ComponentCollection& cc, std::vector<model::ElementBase*> targets, Problem* parent = nullptr);

    Problem(const Problem&) = delete;
    Problem& operator=(const Problem&) = delete;

    // Registers `e` and, transitively, its parents that are not registered yet.
    // Already registered elements are left where they are.
    void add(model::ElementBase* e);

    // Nested problem for `targets`, owned by this problem
    Problem* addNested(std::vector<model::ElementBase*> targets);

    const std::vector<model::ElementBase*>& targets() const { return targets_; }
    const std::vector<ProblemComponent*>& components() const { return components_; }
    const std::vector<std::unique_ptr<Problem>>& nested() const { return nested_; }
    Problem* parent() const { return parent_; }
    int depth() const { return depth_; }
    ComponentCollection& collection() const { return cc_; }

    bool isAncestorOrSelfOf(const Problem* p) const;

    // Element and evidence factors of this problem's components, followed by
    // the solutions of its nested problems
    std::vector<utils::Factor> allFactors() const;

    // Target variables, then every variable of allFactors() that is owned,
    // or mentioned by a factor, outside this problem's subtree. No duplicates.
    // A variable shared by sibling subtrees is only summed out where all of
    // its factors meet.
    std::vector<utils::VariablePtr> globals() const;

    std::vector<utils::Factor> solution;
    bool solved = false;

private:
    ComponentCollection& cc_;
    std::vector<model::ElementBase*> targets_;
    std::vector<ProblemComponent*> components_;
    std::vector<std::unique_ptr<Problem>> nested_;
    Problem* parent_ = nullptr;
    int depth_ = 0;
};

} // namespace sbp
