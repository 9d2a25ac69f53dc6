#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "Factor.h"
#include "Variable.h"

namespace model {

class Universe;
class ElementBase;

// Read access to the variables already generated for other elements
// (implemented by the solver's component registry).
class VariableLookup {
public:
    virtual ~VariableLookup() = default;
    virtual utils::VariablePtr variableOf(const ElementBase& element) const = 0;
};

/**
 * Untyped handle to a random variable of a model.
 * Owned by exactly one Universe; never copied.
 */
class ElementBase {
public:
    explicit ElementBase(std::string name) : name_(std::move(name)) {}
    virtual ~ElementBase() = default;

    ElementBase(const ElementBase&) = delete;
    ElementBase& operator=(const ElementBase&) = delete;

    int id() const { return id_; }
    const std::string& name() const { return name_; }
    Universe* universe() const { return universe_; }

    // Parents whose variables must exist before this element's variable
    virtual std::vector<ElementBase*> args() const = 0;

    // Hard observation / soft constraint present
    virtual bool conditioned() const = 0;
    virtual bool constrained() const = 0;

    // Elements whose solutions feed this element (chains only).
    // Called once the parents' variables exist.
    virtual std::vector<ElementBase*> chainResults(const VariableLookup& /*lookup*/) { return {}; }

    virtual utils::VariablePtr makeVariable(const VariableLookup& lookup) const = 0;
    virtual std::vector<utils::Factor> makeFactors(const VariableLookup& lookup) const = 0;
    virtual std::vector<utils::Factor> makeEvidenceFactors(const VariableLookup& lookup) const = 0;

private:
    friend class Universe;

    int id_ = -1;
    std::string name_;
    Universe* universe_ = nullptr;
};

template <class T>
class Element;

// Typed variable of an element; throws if the registry holds a different type.
template <class T>
std::shared_ptr<const utils::RangeVariable<T>> rangeOf(const VariableLookup& lookup, const Element<T>& e) {
    auto v = std::dynamic_pointer_cast<const utils::RangeVariable<T>>(lookup.variableOf(e));
    if (!v) {
        throw std::runtime_error("rangeOf: variable of " + e.name() + " has an unexpected value type");
    }
    return v;
}

/**
 * Element with values of type T. T must be copyable and ordered by operator<.
 */
template <class T>
class Element : public ElementBase {
public:
    using value_type = T;
    using Constraint = std::function<double(const T&)>;

    explicit Element(std::string name) : ElementBase(std::move(name)) {}

    void observe(const T& value) { observation_ = value; }
    void unobserve() { observation_.reset(); }
    const std::optional<T>& observation() const { return observation_; }

    // Soft evidence: non-negative weight per value
    void addConstraint(Constraint c) {
        if (!c) throw std::invalid_argument("Element::addConstraint: empty constraint on " + name());
        constraints_.push_back(std::move(c));
    }
    void clearConstraints() { constraints_.clear(); }

    bool conditioned() const override { return observation_.has_value(); }
    bool constrained() const override { return !constraints_.empty(); }

    // Observation: indicator on the observed value (irregular entry gets 0).
    // Constraint: weight on regular values, 1.0 on the irregular entry.
    std::vector<utils::Factor> makeEvidenceFactors(const VariableLookup& lookup) const override {
        auto var = rangeOf(lookup, *this);
        std::vector<utils::Factor> out;

        if (observation_) {
            utils::Factor f({var}, 0.0);
            const int i = var->indexOf(*observation_);
            if (i >= 0) f.set({i}, 1.0);
            out.push_back(std::move(f));
        }

        for (const auto& c : constraints_) {
            utils::Factor f({var}, 1.0);
            for (int i = 0; i < var->size(); ++i) {
                if (!var->isRegular(i)) continue;
                const double w = c(var->value(i));
                if (!(w >= 0.0)) {
                    throw std::runtime_error("Element::makeEvidenceFactors: negative constraint weight on " + name());
                }
                f.set({i}, w);
            }
            out.push_back(std::move(f));
        }
        return out;
    }

private:
    std::optional<T> observation_;
    std::vector<Constraint> constraints_;
};

} // namespace model
