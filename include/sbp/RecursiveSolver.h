#pragma once
#include <functional>
#include <vector>

#include "Factor.h"
#include "sbp/Problem.h"

namespace sbp {

/**
 * Solves one problem from its factors.
 * @param problem      the problem being solved
 * @param toEliminate  variables internal to the problem's subtree
 * @param toPreserve   the problem's globals
 * @param factors      problem factors plus nested solutions
 * @return factors over (a subset of) toPreserve
 */
using SolvingStrategy = std::function<std::vector<utils::Factor>(
    const Problem& problem,
    const std::vector<utils::VariablePtr>& toEliminate,
    const std::vector<utils::VariablePtr>& toPreserve,
    const std::vector<utils::Factor>& factors)>;

/**
 * Expands the decomposition tree below a root problem and solves it bottom-up.
 *
 * Expansion generates every component's variable with parents first; the
 * results of a chain that are not registered yet become nested problems of
 * the chain's problem. Every nested problem is solved before its parent.
 */
class RecursiveSolver {
public:
    explicit RecursiveSolver(int max_depth = 64, bool verbose = false);

    void solve(const SolvingStrategy& strategy, Problem& root);

private:
    int max_depth_;
    bool verbose_;

    void expand_(Problem& root);
    void ensureVariable_(ProblemComponent& start);
    void generateFactors_(Problem& root);
    void solveTree_(const SolvingStrategy& strategy, Problem& root);
};

// Pre-order list of root and all problems below it
std::vector<Problem*> collectProblems(Problem& root);

} // namespace sbp
