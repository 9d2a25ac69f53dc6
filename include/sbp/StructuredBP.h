#pragma once
#include <memory>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Factor.h"
#include "model/Universe.h"
#include "sbp/Algorithm.h"
#include "sbp/ComponentCollection.h"
#include "sbp/Config.h"
#include "sbp/Errors.h"
#include "sbp/Problem.h"
#include "sbp/RecursiveSolver.h"

// Profiling utilities for StructuredBP::run
void printStructuredBPProfile();
void resetStructuredBPProfile();

namespace sbp {

/**
 * Structured belief propagation.
 *
 * Builds a problem from the query targets and every evidence element of their
 * universe, solves the decomposition tree with belief propagation at each
 * node, multiplies the root solution into one joint factor and stores, per
 * target, the joint marginalized onto the target and normalized.
 *
 * Usage:
 *   auto res = sbp::StructuredBP::create(10, {b});
 *   if (!res) { ... res.error->what() ... }
 *   res.algorithm->start();
 *   auto dist = res.algorithm->computeDistribution(b);
 *   res.algorithm->kill();
 */
class StructuredBP : public Algorithm {
    // Restricts the public constructor to create()
    struct CreateKey {
        explicit CreateKey() = default;
    };

public:
    struct CreateResult {
        std::unique_ptr<StructuredBP> algorithm;
        std::optional<ConfigurationError> error;

        bool ok() const { return algorithm != nullptr; }
        explicit operator bool() const { return ok(); }
    };

    StructuredBP(CreateKey, model::Universe& universe, BPConfig config, std::vector<model::ElementBase*> targets)
        : StructuredBP(universe, config, std::move(targets)) {}

    // Never throws for invalid settings; the error is returned instead
    static CreateResult create(int iterations, std::vector<model::ElementBase*> targets);
    static CreateResult create(const BPConfig& config, std::vector<model::ElementBase*> targets);

    const std::vector<model::ElementBase*>& targets() const { return targets_; }
    const BPConfig& config() const { return config_; }
    model::Universe& universe() const { return *universe_; }

    // A run completed and its marginals are available
    bool ready() const { return ready_; }

    // Normalized marginal of `target`; throws std::runtime_error before a
    // successful run or for an element that is not a target
    const utils::Factor& targetFactor(const model::ElementBase* target) const;

    // (probability, value) per regular range entry, in range order.
    // Irregular entries are left out and the rest is not renormalized.
    template <class T>
    std::vector<std::pair<double, T>> computeDistribution(const model::Element<T>* target) const {
        const utils::Factor& f = targetFactor(target);
        auto var = std::dynamic_pointer_cast<const utils::RangeVariable<T>>(f.variables().front());
        if (!var) {
            throw std::runtime_error("StructuredBP::computeDistribution: unexpected value type for " + target->name());
        }
        std::vector<std::pair<double, T>> out;
        for (const auto& idx : f.getIndices()) {
            if (var->isRegular(idx[0])) out.emplace_back(f.get(idx), var->value(idx[0]));
        }
        return out;
    }

    template <class T, class Fn>
    double computeExpectation(const model::Element<T>* target, Fn fn) const {
        double acc = 0.0;
        for (const auto& pv : computeDistribution(target)) acc += pv.first * fn(pv.second);
        return acc;
    }

    template <class T, class Pred,
              std::enable_if_t<std::is_invocable_r_v<bool, Pred, const T&>, int> = 0>
    double probability(const model::Element<T>* target, Pred pred) const {
        return computeExpectation(target, [&pred](const T& v) { return pred(v) ? 1.0 : 0.0; });
    }

    template <class T>
    double mean(const model::Element<T>* target) const {
        static_assert(std::is_arithmetic<T>::value, "mean needs an arithmetic value type");
        return computeExpectation(target, [](const T& v) { return (double)v; });
    }

    template <class T>
    double variance(const model::Element<T>* target) const {
        const double m = mean(target);
        return computeExpectation(target, [m](const T& v) { return ((double)v - m) * ((double)v - m); });
    }

    template <class T, class V,
              std::enable_if_t<!std::is_invocable_v<V, const T&>, int> = 0>
    double probability(const model::Element<T>* target, const V& value) const {
        return probability(target, [&value](const T& v) { return v == value; });
    }

protected:
    StructuredBP(model::Universe& universe, BPConfig config, std::vector<model::ElementBase*> targets);

    // Strategy handed to the recursive solver
    virtual SolvingStrategy makeStrategy() const;

    void run() override;
    void cleanUp() override;

private:
    model::Universe* universe_;
    BPConfig config_;
    std::vector<model::ElementBase*> targets_;

    // per-run state
    std::unique_ptr<ComponentCollection> cc_;
    std::unique_ptr<Problem> problem_;

    std::unordered_map<const model::ElementBase*, utils::Factor> target_factors_;
    bool ready_ = false;

    static std::optional<ConfigurationError> validate_(const BPConfig& config,
                                                       const std::vector<model::ElementBase*>& targets);
};

// One-shot query: create, start, query, kill. Throws the ConfigurationError
// when the algorithm cannot be created.
template <class T, class Pred,
          std::enable_if_t<std::is_invocable_r_v<bool, Pred, const T&>, int> = 0>
double probability(model::Element<T>* target, Pred pred, int iterations) {
    auto res = StructuredBP::create(iterations, {target});
    if (!res) throw *res.error;
    res.algorithm->start();
    const double p = res.algorithm->probability(target, pred);
    res.algorithm->kill();
    return p;
}

template <class T, class V,
          std::enable_if_t<!std::is_invocable_v<V, const T&>, int> = 0>
double probability(model::Element<T>* target, const V& value, int iterations = 100) {
    return probability(target, [&value](const T& v) { return v == value; }, iterations);
}

} // namespace sbp
