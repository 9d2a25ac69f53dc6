#pragma once

namespace sbp {

/**
 * Configuration for structured belief propagation
 */
struct BPConfig {
    int iterations = 100;               // BP sweeps per subproblem
    double damping = 0.0;               // weight of the old factor message, in [0, 1)
    double convergence_tolerance = 0.0; // > 0: stop a subproblem once max message change is below it
    int max_depth = 64;                 // deepest allowed nesting of subproblems
    bool verbose = false;               // progress lines on std::cout
};

} // namespace sbp
