#include "model/Atomic.h"

#include <algorithm>
#include <cmath>

namespace model {

namespace {
std::vector<Select<bool>::Clause> flipClauses(const std::string& name, double p) {
    if (!(p >= 0.0 && p <= 1.0)) {
        throw std::invalid_argument("Flip: probability of " + name + " outside [0, 1]");
    }
    return {{1.0 - p, false}, {p, true}};
}
}

Flip::Flip(std::string name, double p)
    : Select<bool>(name, flipClauses(name, p)), p_(p) {}

Poisson::Poisson(std::string name, double lambda, int max_value)
    : Element<int>(std::move(name)), lambda_(lambda), max_value_(max_value) {
    if (!(lambda_ > 0.0)) {
        throw std::invalid_argument("Poisson: rate of " + this->name() + " must be positive");
    }
    if (max_value_ < 0) {
        throw std::invalid_argument("Poisson: negative max_value for " + this->name());
    }
}

utils::VariablePtr Poisson::makeVariable(const VariableLookup&) const {
    std::vector<int> values(max_value_ + 1);
    for (int k = 0; k <= max_value_; ++k) values[k] = k;
    return std::make_shared<utils::RangeVariable<int>>(name(), utils::makeRange<int>(std::move(values), true));
}

std::vector<utils::Factor> Poisson::makeFactors(const VariableLookup& lookup) const {
    auto var = rangeOf(lookup, *this);
    utils::Factor f({var}, 0.0);

    // pmf(k) = exp(k log(lambda) - lambda - log(k!))
    double head = 0.0;
    for (int k = 0; k <= max_value_; ++k) {
        const double pk = std::exp(k * std::log(lambda_) - lambda_ - std::lgamma(k + 1.0));
        f.set({var->indexOf(k)}, pk);
        head += pk;
    }
    f.set({var->starIndex()}, std::max(0.0, 1.0 - head));
    return {f};
}

} // namespace model
