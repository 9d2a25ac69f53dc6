#pragma once
#include <vector>

#include "Factor.h"
#include "sbp/Config.h"
#include "sbp/RecursiveSolver.h"

namespace sbp {

/**
 * Loopy sum-product BP over the factors of one problem.
 *
 * Factors whose scope lies inside another factor's scope are multiplied into
 * it before the graph is built. Returns, in order of preference:
 *  - the belief of the single preserved variable,
 *  - the belief of a factor whose scope covers every preserved variable,
 *    summed down to the preserved variables,
 *  - the joint over the preserved variables, by summing out the eliminated
 *    variables from the problem's factors.
 * The result is normalized. No preserved variables: empty result.
 */
class BeliefPropagation {
public:
    explicit BeliefPropagation(BPConfig config) : config_(config) {}

    std::vector<utils::Factor> operator()(const Problem& problem,
                                          const std::vector<utils::VariablePtr>& toEliminate,
                                          const std::vector<utils::VariablePtr>& toPreserve,
                                          const std::vector<utils::Factor>& factors) const;

    const BPConfig& config() const { return config_; }

private:
    BPConfig config_;
};

// Strategy running `iterations` synchronous sweeps per problem
SolvingStrategy beliefPropagation(int iterations);
SolvingStrategy beliefPropagation(const BPConfig& config);

} // namespace sbp
