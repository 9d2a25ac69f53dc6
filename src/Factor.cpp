// Factor.cpp
#include "Factor.h"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>

namespace utils {

namespace {
// Guard against accidental blow-up of joint tables
constexpr long long kMaxEntries = 1LL << 26;
}

const SumProductSemiring& SumProductSemiring::instance() {
    static const SumProductSemiring s;
    return s;
}

Factor::Factor() {
    computeLayout_();
    P_.setConstant(1, 1.0);
}

Factor::Factor(std::vector<VariablePtr> variables, double fill)
    : vars_(std::move(variables)) {
    for (const auto& v : vars_) {
        if (!v) throw std::invalid_argument("Factor: null variable");
    }
    for (size_t i = 0; i < vars_.size(); ++i) {
        for (size_t j = i + 1; j < vars_.size(); ++j) {
            if (vars_[i]->id() == vars_[j]->id()) {
                throw std::invalid_argument("Factor: duplicate variable " + vars_[i]->name());
            }
        }
    }
    computeLayout_();
    long long n = 1;
    for (int d : dims_) n *= d;
    P_.setConstant((Eigen::Index)n, fill);
}

Factor Factor::unit(const Semiring& semiring) {
    Factor f;
    f.P_[0] = semiring.one();
    return f;
}

void Factor::computeLayout_() {
    dims_.resize(vars_.size());
    strides_.resize(vars_.size());
    long long n = 1;
    for (int k = (int)vars_.size() - 1; k >= 0; --k) {
        dims_[k] = vars_[k]->size();
        strides_[k] = (int)n;
        n *= dims_[k];
        if (n > kMaxEntries) {
            throw std::runtime_error("Factor::computeLayout_: table too large");
        }
    }
}

int Factor::indexOf(const Variable& v) const {
    for (int k = 0; k < (int)vars_.size(); ++k) {
        if (vars_[k]->id() == v.id()) return k;
    }
    return -1;
}

int Factor::flatIndex(const std::vector<int>& indices) const {
    if (indices.size() != vars_.size()) {
        throw std::invalid_argument("Factor::flatIndex: expected " + std::to_string(vars_.size()) +
                                    " indices, got " + std::to_string(indices.size()));
    }
    int flat = 0;
    for (size_t k = 0; k < indices.size(); ++k) {
        if (indices[k] < 0 || indices[k] >= dims_[k]) {
            throw std::invalid_argument("Factor::flatIndex: index out of range for " + vars_[k]->name());
        }
        flat += indices[k] * strides_[k];
    }
    return flat;
}

std::vector<int> Factor::indicesOf(int flat) const {
    std::vector<int> idx(vars_.size(), 0);
    for (size_t k = 0; k < vars_.size(); ++k) {
        idx[k] = flat / strides_[k];
        flat -= idx[k] * strides_[k];
    }
    return idx;
}

double Factor::get(const std::vector<int>& indices) const {
    return P_[flatIndex(indices)];
}

void Factor::set(const std::vector<int>& indices, double value) {
    P_[flatIndex(indices)] = value;
}

std::vector<std::vector<int>> Factor::getIndices() const {
    std::vector<std::vector<int>> out;
    out.reserve(P_.size());
    for (int i = 0; i < (int)P_.size(); ++i) out.push_back(indicesOf(i));
    return out;
}

Factor Factor::product(const Factor& other) const {
    return product(other, SumProductSemiring::instance());
}

Factor Factor::product(const Factor& other, const Semiring& semiring) const {
    // result variables: ours, then the other's new ones
    std::vector<VariablePtr> vars = vars_;
    for (const auto& v : other.vars_) {
        if (indexOf(*v) < 0) vars.push_back(v);
    }
    Factor out(vars);

    const int n = (int)vars.size();
    // per result dimension: stride into this / other (0 if absent)
    std::vector<int> sa(n, 0), sb(n, 0);
    for (int k = 0; k < n; ++k) {
        const int ia = indexOf(*vars[k]);
        const int ib = other.indexOf(*vars[k]);
        if (ia >= 0) sa[k] = strides_[ia];
        if (ib >= 0) sb[k] = other.strides_[ib];
    }

    std::vector<int> idx(n, 0);
    int oa = 0, ob = 0;
    for (int i = 0; i < out.size(); ++i) {
        out.P_[i] = semiring.product(P_[oa], other.P_[ob]);

        // odometer increment, last dimension fastest
        int k = n - 1;
        while (k >= 0) {
            idx[k]++;
            oa += sa[k];
            ob += sb[k];
            if (idx[k] < out.dims_[k]) break;
            oa -= sa[k] * idx[k];
            ob -= sb[k] * idx[k];
            idx[k] = 0;
            k--;
        }
    }
    return out;
}

Factor Factor::marginalizeTo(const Semiring& semiring, const Variable& target) const {
    const int k = indexOf(target);
    if (k < 0) {
        throw std::invalid_argument("Factor::marginalizeTo: variable " + target.name() +
                                    " is not a dimension of this factor");
    }
    return marginalizeTo(semiring, std::vector<VariablePtr>{vars_[k]});
}

Factor Factor::marginalizeTo(const Semiring& semiring, const std::vector<VariablePtr>& keep) const {
    std::vector<int> pos;
    pos.reserve(keep.size());
    for (const auto& v : keep) {
        const int k = indexOf(*v);
        if (k < 0) {
            throw std::invalid_argument("Factor::marginalizeTo: variable " + v->name() +
                                        " is not a dimension of this factor");
        }
        pos.push_back(k);
    }

    Factor out(keep, semiring.zero());
    const int n = numVars();
    // stride into the result for each of our dimensions (0 if summed out)
    std::vector<int> so(n, 0);
    for (size_t j = 0; j < pos.size(); ++j) so[pos[j]] = out.strides_[j];

    std::vector<int> idx(n, 0);
    int o = 0;
    for (int i = 0; i < size(); ++i) {
        out.P_[o] = semiring.sum(out.P_[o], P_[i]);

        int k = n - 1;
        while (k >= 0) {
            idx[k]++;
            o += so[k];
            if (idx[k] < dims_[k]) break;
            o -= so[k] * idx[k];
            idx[k] = 0;
            k--;
        }
    }
    return out;
}

Factor Factor::normalized() const {
    Factor out(*this);
    const double z = P_.sum();
    if (z > 0.0 && std::isfinite(z)) out.P_ /= z;
    return out;
}

void Factor::write(std::ostream& os) const {
    os << "Factor(";
    for (size_t k = 0; k < vars_.size(); ++k) {
        os << vars_[k]->name() << (k + 1 == vars_.size() ? "" : ", ");
    }
    os << ")\n";
    for (int i = 0; i < size(); ++i) {
        const auto idx = indicesOf(i);
        os << "  [";
        for (size_t k = 0; k < idx.size(); ++k) {
            os << vars_[k]->label(idx[k]) << (k + 1 == idx.size() ? "" : " ");
        }
        os << "] " << std::setprecision(6) << P_[i] << "\n";
    }
}

std::ostream& operator<<(std::ostream& os, const Factor& f) {
    f.write(os);
    return os;
}

} // namespace utils
