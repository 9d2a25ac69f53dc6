#include "sbp/BeliefPropagation.h"
#include "sbp/FactorGraph.h"

#include <algorithm>
#include <iostream>
#include <numeric>

namespace sbp {

namespace {

bool coversScope(const utils::Factor& outer, const utils::Factor& inner) {
    for (const auto& v : inner.variables()) {
        if (!outer.contains(*v)) return false;
    }
    return true;
}

// Multiply every factor whose scope lies inside another factor's scope into
// that factor. Factors without variables are dropped.
std::vector<utils::Factor> absorbSubsumed(const std::vector<utils::Factor>& factors) {
    std::vector<int> order(factors.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&factors](int a, int b) { return factors[a].numVars() > factors[b].numVars(); });

    const auto& sr = utils::SumProductSemiring::instance();
    std::vector<utils::Factor> kept;
    for (int i : order) {
        const utils::Factor& f = factors[i];
        if (f.numVars() == 0) continue;
        auto host = std::find_if(kept.begin(), kept.end(),
                                 [&f](const utils::Factor& k) { return coversScope(k, f); });
        if (host != kept.end()) {
            *host = host->product(f, sr);
        } else {
            kept.push_back(f);
        }
    }
    return kept;
}

// Sum out toEliminate one variable at a time, cheapest first, and return the
// normalized joint over toPreserve
utils::Factor eliminateToJoint(const std::vector<utils::Factor>& factors,
                               const std::vector<utils::VariablePtr>& toEliminate,
                               const std::vector<utils::VariablePtr>& toPreserve) {
    const auto& sr = utils::SumProductSemiring::instance();
    std::vector<utils::Factor> pool = factors;
    std::vector<utils::VariablePtr> remaining = toEliminate;

    while (!remaining.empty()) {
        // pick the variable whose bucket product is smallest
        int best = -1;
        long long best_size = 0;
        for (int k = 0; k < (int)remaining.size(); ++k) {
            std::vector<int> seen;
            long long size = 1;
            for (const auto& f : pool) {
                if (!f.contains(*remaining[k])) continue;
                for (const auto& v : f.variables()) {
                    if (std::find(seen.begin(), seen.end(), v->id()) != seen.end()) continue;
                    seen.push_back(v->id());
                    size *= v->size();
                }
            }
            if (best < 0 || size < best_size) {
                best = k;
                best_size = size;
            }
        }

        const utils::Variable& var = *remaining[best];
        utils::Factor bucket = utils::Factor::unit(sr);
        std::vector<utils::Factor> rest;
        bool used = false;
        for (auto& f : pool) {
            if (f.contains(var)) {
                bucket = bucket.product(f, sr);
                used = true;
            } else {
                rest.push_back(std::move(f));
            }
        }
        if (used) {
            std::vector<utils::VariablePtr> keep;
            for (const auto& v : bucket.variables()) {
                if (v->id() != var.id()) keep.push_back(v);
            }
            rest.push_back(bucket.marginalizeTo(sr, keep));
        }
        pool = std::move(rest);
        remaining.erase(remaining.begin() + best);
    }

    utils::Factor joint = utils::Factor::unit(sr);
    for (const auto& f : pool) joint = joint.product(f, sr);
    for (const auto& v : toPreserve) {
        if (!joint.contains(*v)) joint = joint.product(utils::Factor({v}, 1.0), sr);
    }
    return joint.marginalizeTo(sr, toPreserve).normalized();
}

} // namespace

std::vector<utils::Factor> BeliefPropagation::operator()(const Problem& problem,
                                                         const std::vector<utils::VariablePtr>& toEliminate,
                                                         const std::vector<utils::VariablePtr>& toPreserve,
                                                         const std::vector<utils::Factor>& factors) const {
    if (toPreserve.empty()) return {};

    const std::vector<utils::Factor> merged = absorbSubsumed(factors);

    FactorGraph g;
    g.damping = config_.damping;
    for (const auto& f : merged) g.addFactor(f);
    for (const auto& v : toPreserve) g.addVariable(v);

    g.initialize();
    const int sweeps = g.run(config_.iterations, config_.convergence_tolerance);

    if (config_.verbose) {
        std::cout << "[BP] depth " << problem.depth() << ": " << g.numVariables() << " variables ("
                  << toEliminate.size() << " eliminated), " << g.numFactors() << " factors ("
                  << factors.size() << " before merging), " << sweeps << " sweeps\n";
    }

    if (toPreserve.size() == 1) {
        return {g.findVariable(*toPreserve.front())->beliefFactor()};
    }

    for (const auto& fptr : g.factors) {
        bool covers = true;
        for (const auto& v : toPreserve) {
            if (!fptr->factor.contains(*v)) {
                covers = false;
                break;
            }
        }
        if (covers) {
            const auto& sr = utils::SumProductSemiring::instance();
            return {fptr->beliefFactor().marginalizeTo(sr, toPreserve).normalized()};
        }
    }

    // no factor spans the preserved variables: keep their correlation
    return {eliminateToJoint(merged, toEliminate, toPreserve)};
}

SolvingStrategy beliefPropagation(int iterations) {
    BPConfig config;
    config.iterations = iterations;
    return beliefPropagation(config);
}

SolvingStrategy beliefPropagation(const BPConfig& config) {
    return BeliefPropagation(config);
}

} // namespace sbp
