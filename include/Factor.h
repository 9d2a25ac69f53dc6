// Factor.h
#pragma once

#include <Eigen/Dense>
#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <vector>

#include "Variable.h"

namespace utils {

// Commutative semiring used to combine (product) and eliminate (sum) entries.
class Semiring {
public:
    virtual ~Semiring() = default;
    virtual double zero() const = 0;
    virtual double one() const = 0;
    virtual double sum(double a, double b) const = 0;
    virtual double product(double a, double b) const = 0;
};

class SumProductSemiring final : public Semiring {
public:
    double zero() const override { return 0.0; }
    double one() const override { return 1.0; }
    double sum(double a, double b) const override { return a + b; }
    double product(double a, double b) const override { return a * b; }

    static const SumProductSemiring& instance();
};

using VariablePtr = std::shared_ptr<const Variable>;

// Dense table over the Cartesian product of its variables' ranges.
// Layout is row-major: the first variable is the slowest-varying index.
// A factor with no variables holds exactly one entry.
class Factor {
public:
    Factor();
    explicit Factor(std::vector<VariablePtr> variables, double fill = 0.0);

    // Multiplicative identity of the semiring (no variables, one entry)
    static Factor unit(const Semiring& semiring);

    const std::vector<VariablePtr>& variables() const { return vars_; }
    int numVars() const { return (int)vars_.size(); }
    int size() const { return (int)P_.size(); }
    const std::vector<int>& dims() const { return dims_; }

    // Position of v among this factor's variables, -1 if absent
    int indexOf(const Variable& v) const;
    bool contains(const Variable& v) const { return indexOf(v) >= 0; }

    double get(const std::vector<int>& indices) const;
    void set(const std::vector<int>& indices, double value);

    double entry(int flat) const { return P_[flat]; }
    void setEntry(int flat, double value) { P_[flat] = value; }

    int flatIndex(const std::vector<int>& indices) const;
    std::vector<int> indicesOf(int flat) const;

    // All index tuples in layout order
    std::vector<std::vector<int>> getIndices() const;

    const Eigen::VectorXd& table() const { return P_; }
    Eigen::VectorXd& tableRef() { return P_; }

    Factor product(const Factor& other) const;
    Factor product(const Factor& other, const Semiring& semiring) const;

    // Sums out every variable except `target`.
    // Throws std::invalid_argument if `target` is not a variable of this factor.
    Factor marginalizeTo(const Semiring& semiring, const Variable& target) const;
    Factor marginalizeTo(const Semiring& semiring, const std::vector<VariablePtr>& keep) const;

    template <class Fn>
    double foldLeft(double seed, Fn fn) const {
        double acc = seed;
        for (int i = 0; i < (int)P_.size(); ++i) acc = fn(acc, P_[i]);
        return acc;
    }

    template <class Fn>
    Factor mapTo(Fn fn) const {
        Factor out(*this);
        for (int i = 0; i < (int)out.P_.size(); ++i) out.P_[i] = fn(P_[i]);
        return out;
    }

    double sum() const { return P_.sum(); }

    // Entries divided by sum(); an all-zero factor is returned unchanged
    Factor normalized() const;

    void write(std::ostream& os) const;

private:
    std::vector<VariablePtr> vars_;
    std::vector<int> dims_;
    std::vector<int> strides_;
    Eigen::VectorXd P_;

    void computeLayout_();
};

std::ostream& operator<<(std::ostream& os, const Factor& f);

} // namespace utils
