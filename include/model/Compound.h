#pragma once

#include <map>
#include <memory>
#include <utility>
#include <vector>

#include "model/Element.h"

namespace model {

namespace detail {
// Regular entries equal, or both irregular
template <class T>
bool sameEntry(const utils::RangeVariable<T>& a, int i, const utils::RangeVariable<T>& b, int j) {
    if (a.isRegular(i) != b.isRegular(j)) return false;
    if (!a.isRegular(i)) return true;
    return !(a.value(i) < b.value(j)) && !(b.value(j) < a.value(i));
}
}

// Deterministic function of one parent. An irregular parent entry maps to `*`.
template <class P, class T>
class Apply : public Element<T> {
public:
    using Function = std::function<T(const P&)>;

    Apply(std::string name, Element<P>* parent, Function fn)
        : Element<T>(std::move(name)), parent_(parent), fn_(std::move(fn)) {
        if (!fn_) throw std::invalid_argument("Apply: empty function for " + this->name());
    }

    std::vector<ElementBase*> args() const override { return {parent_}; }

    utils::VariablePtr makeVariable(const VariableLookup& lookup) const override {
        auto pv = rangeOf(lookup, *parent_);
        std::vector<T> values;
        for (int i = 0; i < pv->size(); ++i) {
            if (pv->isRegular(i)) values.push_back(fn_(pv->value(i)));
        }
        return std::make_shared<utils::RangeVariable<T>>(this->name(),
                                                         utils::makeRange<T>(std::move(values), pv->hasStar()));
    }

    std::vector<utils::Factor> makeFactors(const VariableLookup& lookup) const override {
        auto pv = rangeOf(lookup, *parent_);
        auto sv = rangeOf(lookup, *this);
        utils::Factor f({pv, sv}, 0.0);
        for (int i = 0; i < pv->size(); ++i) {
            const int j = pv->isRegular(i) ? sv->indexOf(fn_(pv->value(i))) : sv->starIndex();
            f.set({i, j}, 1.0);
        }
        return {f};
    }

private:
    Element<P>* parent_;
    Function fn_;
};

// Deterministic function of two parents
template <class P1, class P2, class T>
class Apply2 : public Element<T> {
public:
    using Function = std::function<T(const P1&, const P2&)>;

    Apply2(std::string name, Element<P1>* parent1, Element<P2>* parent2, Function fn)
        : Element<T>(std::move(name)), parent1_(parent1), parent2_(parent2), fn_(std::move(fn)) {
        if (!fn_) throw std::invalid_argument("Apply2: empty function for " + this->name());
        if (static_cast<ElementBase*>(parent1) == static_cast<ElementBase*>(parent2)) {
            throw std::invalid_argument("Apply2: both parents of " + this->name() + " are the same element");
        }
    }

    std::vector<ElementBase*> args() const override { return {parent1_, parent2_}; }

    utils::VariablePtr makeVariable(const VariableLookup& lookup) const override {
        auto v1 = rangeOf(lookup, *parent1_);
        auto v2 = rangeOf(lookup, *parent2_);
        std::vector<T> values;
        for (int i = 0; i < v1->size(); ++i) {
            if (!v1->isRegular(i)) continue;
            for (int j = 0; j < v2->size(); ++j) {
                if (v2->isRegular(j)) values.push_back(fn_(v1->value(i), v2->value(j)));
            }
        }
        const bool star = v1->hasStar() || v2->hasStar();
        return std::make_shared<utils::RangeVariable<T>>(this->name(), utils::makeRange<T>(std::move(values), star));
    }

    std::vector<utils::Factor> makeFactors(const VariableLookup& lookup) const override {
        auto v1 = rangeOf(lookup, *parent1_);
        auto v2 = rangeOf(lookup, *parent2_);
        auto sv = rangeOf(lookup, *this);
        utils::Factor f({v1, v2, sv}, 0.0);
        for (int i = 0; i < v1->size(); ++i) {
            for (int j = 0; j < v2->size(); ++j) {
                const int k = (v1->isRegular(i) && v2->isRegular(j))
                                  ? sv->indexOf(fn_(v1->value(i), v2->value(j)))
                                  : sv->starIndex();
                f.set({i, j, k}, 1.0);
            }
        }
        return {f};
    }

private:
    Element<P1>* parent1_;
    Element<P2>* parent2_;
    Function fn_;
};

/**
 * The parent's value selects a result element; this element takes the
 * result's value. Results are memoized per parent value, so the function is
 * called at most once per value. Each result that is not already part of the
 * enclosing problem is solved as a nested subproblem.
 */
template <class P, class T>
class Chain : public Element<T> {
public:
    using Function = std::function<Element<T>*(const P&)>;

    Chain(std::string name, Element<P>* parent, Function fn)
        : Element<T>(std::move(name)), parent_(parent), fn_(std::move(fn)) {
        if (!fn_) throw std::invalid_argument("Chain: empty function for " + this->name());
    }

    Element<P>* parent() const { return parent_; }

    std::vector<ElementBase*> args() const override { return {parent_}; }

    // One result per regular parent value, in range order
    std::vector<ElementBase*> chainResults(const VariableLookup& lookup) override {
        auto pv = rangeOf(lookup, *parent_);
        std::vector<ElementBase*> out;
        for (int i = 0; i < pv->size(); ++i) {
            if (pv->isRegular(i)) out.push_back(resultFor(pv->value(i)));
        }
        return out;
    }

    Element<T>* resultFor(const P& value) {
        auto it = cache_.find(value);
        if (it != cache_.end()) return it->second;
        Element<T>* r = fn_(value);
        if (r == nullptr) {
            throw std::runtime_error("Chain: function of " + this->name() + " returned no element");
        }
        if (r == this) {
            throw std::runtime_error("Chain: " + this->name() + " selects itself");
        }
        cache_.emplace(value, r);
        return r;
    }

    utils::VariablePtr makeVariable(const VariableLookup& lookup) const override {
        auto pv = rangeOf(lookup, *parent_);
        std::vector<T> values;
        bool star = pv->hasStar();
        for (int i = 0; i < pv->size(); ++i) {
            if (!pv->isRegular(i)) continue;
            auto rv = rangeOf(lookup, *cached(pv->value(i)));
            for (int j = 0; j < rv->size(); ++j) {
                if (rv->isRegular(j)) values.push_back(rv->value(j));
            }
            star = star || rv->hasStar();
        }
        return std::make_shared<utils::RangeVariable<T>>(this->name(), utils::makeRange<T>(std::move(values), star));
    }

    // One selector factor over (parent, this, results...): for a regular
    // parent entry i, 1 iff this element agrees with result_i; for an
    // irregular parent entry, 1 iff this element is `*`.
    std::vector<utils::Factor> makeFactors(const VariableLookup& lookup) const override {
        auto pv = rangeOf(lookup, *parent_);
        auto sv = rangeOf(lookup, *this);

        std::vector<utils::VariablePtr> scope{pv, sv};
        // per parent entry: result variable and its position in scope (-1: irregular entry)
        std::vector<std::shared_ptr<const utils::RangeVariable<T>>> rvs(pv->size());
        std::vector<int> pos(pv->size(), -1);
        for (int i = 0; i < pv->size(); ++i) {
            if (!pv->isRegular(i)) continue;
            rvs[i] = rangeOf(lookup, *cached(pv->value(i)));
            int k = 0;
            while (k < (int)scope.size() && scope[k]->id() != rvs[i]->id()) ++k;
            if (k == (int)scope.size()) scope.push_back(rvs[i]);
            pos[i] = k;
        }

        utils::Factor f(scope, 0.0);
        for (int flat = 0; flat < f.size(); ++flat) {
            const std::vector<int> idx = f.indicesOf(flat);
            const int i = idx[0];
            const int b = idx[1];
            const bool match = pv->isRegular(i) ? detail::sameEntry(*rvs[i], idx[pos[i]], *sv, b)
                                                : !sv->isRegular(b);
            f.setEntry(flat, match ? 1.0 : 0.0);
        }
        return {f};
    }

private:
    Element<P>* parent_;
    Function fn_;
    std::map<P, Element<T>*> cache_;

    const Element<T>* cached(const P& value) const {
        auto it = cache_.find(value);
        if (it == cache_.end()) {
            throw std::runtime_error("Chain: " + this->name() + " was not expanded for a parent value");
        }
        return it->second;
    }
};

// Chain on a boolean test with fixed branches
template <class T>
class If : public Chain<bool, T> {
public:
    If(std::string name, Element<bool>* test, Element<T>* then_branch, Element<T>* else_branch)
        : Chain<bool, T>(std::move(name), test,
                         [then_branch, else_branch](const bool& b) { return b ? then_branch : else_branch; }) {
        if (then_branch == nullptr || else_branch == nullptr) {
            throw std::invalid_argument("If: missing branch for " + this->name());
        }
    }
};

} // namespace model
