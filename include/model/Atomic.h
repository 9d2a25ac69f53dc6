#pragma once

#include <utility>
#include <vector>

#include "model/Element.h"

namespace model {

// Element with a single fixed value
template <class T>
class Constant : public Element<T> {
public:
    Constant(std::string name, T value) : Element<T>(std::move(name)), value_(std::move(value)) {}

    const T& value() const { return value_; }

    std::vector<ElementBase*> args() const override { return {}; }

    utils::VariablePtr makeVariable(const VariableLookup&) const override {
        return std::make_shared<utils::RangeVariable<T>>(this->name(), utils::makeRange<T>({value_}, false));
    }

    std::vector<utils::Factor> makeFactors(const VariableLookup& lookup) const override {
        auto var = rangeOf(lookup, *this);
        utils::Factor f({var}, 0.0);
        f.set({var->indexOf(value_)}, 1.0);
        return {f};
    }

private:
    T value_;
};

/**
 * Categorical element over explicit (probability, value) clauses.
 * Probabilities are normalized; repeated values accumulate.
 */
template <class T>
class Select : public Element<T> {
public:
    using Clause = std::pair<double, T>;

    Select(std::string name, std::vector<Clause> clauses)
        : Element<T>(std::move(name)), clauses_(std::move(clauses)) {
        if (clauses_.empty()) {
            throw std::invalid_argument("Select: no clauses for " + this->name());
        }
        double total = 0.0;
        for (const auto& c : clauses_) {
            if (!(c.first >= 0.0)) {
                throw std::invalid_argument("Select: negative probability in " + this->name());
            }
            total += c.first;
        }
        if (!(total > 0.0)) {
            throw std::invalid_argument("Select: probabilities of " + this->name() + " sum to zero");
        }
        for (auto& c : clauses_) c.first /= total;
    }

    const std::vector<Clause>& clauses() const { return clauses_; }

    std::vector<ElementBase*> args() const override { return {}; }

    utils::VariablePtr makeVariable(const VariableLookup&) const override {
        std::vector<T> values;
        values.reserve(clauses_.size());
        for (const auto& c : clauses_) values.push_back(c.second);
        return std::make_shared<utils::RangeVariable<T>>(this->name(), utils::makeRange<T>(std::move(values), false));
    }

    std::vector<utils::Factor> makeFactors(const VariableLookup& lookup) const override {
        auto var = rangeOf(lookup, *this);
        utils::Factor f({var}, 0.0);
        for (const auto& c : clauses_) {
            const int i = var->indexOf(c.second);
            f.set({i}, f.get({i}) + c.first);
        }
        return {f};
    }

private:
    std::vector<Clause> clauses_;
};

// Bernoulli element: true with probability p
class Flip : public Select<bool> {
public:
    Flip(std::string name, double p);

    double p() const { return p_; }

private:
    double p_;
};

/**
 * Poisson-distributed count truncated at max_value.
 * Values 0..max_value are regular; the tail mass P(k > max_value) sits on the
 * irregular entry.
 */
class Poisson : public Element<int> {
public:
    Poisson(std::string name, double lambda, int max_value);

    double lambda() const { return lambda_; }
    int maxValue() const { return max_value_; }

    std::vector<ElementBase*> args() const override { return {}; }
    utils::VariablePtr makeVariable(const VariableLookup& lookup) const override;
    std::vector<utils::Factor> makeFactors(const VariableLookup& lookup) const override;

private:
    double lambda_;
    int max_value_;
};

} // namespace model
