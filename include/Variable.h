// Variable.h
#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>
#include <stdexcept>
#include <utility>

namespace utils {

// Discrete variable: an enumerated range of `size()` entries.
// Regular entries come first (sorted), the irregular entry `*` (if any) is last.
class Variable {
public:
    Variable(int id, std::string name, std::vector<bool> regular);
    virtual ~Variable() = default;

    int id() const { return id_; }
    const std::string& name() const { return name_; }
    int size() const { return (int)regular_.size(); }

    bool isRegular(int i) const { return regular_.at(i); }
    bool hasStar() const;
    int numRegular() const;

    // Label of entry i for printing ("*" for irregular entries)
    virtual std::string label(int i) const;

    static int nextId();

private:
    int id_ = -1;
    std::string name_;
    std::vector<bool> regular_;
};

// Variable whose regular entries carry values of type T.
template <class T>
class RangeVariable : public Variable {
public:
    using Entry = std::optional<T>; // nullopt == irregular

    RangeVariable(std::string name, std::vector<Entry> range)
        : Variable(nextId(), std::move(name), regularMask(range)),
          range_(std::move(range)) {}

    const std::vector<Entry>& range() const { return range_; }

    const T& value(int i) const {
        const Entry& e = range_.at(i);
        if (!e) {
            throw std::runtime_error("RangeVariable::value: irregular entry has no value");
        }
        return *e;
    }

    // -1 if v is not in the range
    int indexOf(const T& v) const {
        for (int i = 0; i < (int)range_.size(); ++i) {
            if (range_[i] && !(*range_[i] < v) && !(v < *range_[i])) return i;
        }
        return -1;
    }

    int starIndex() const {
        for (int i = 0; i < (int)range_.size(); ++i) {
            if (!range_[i]) return i;
        }
        return -1;
    }

private:
    std::vector<Entry> range_;

    static std::vector<bool> regularMask(const std::vector<Entry>& range) {
        if (range.empty()) {
            throw std::runtime_error("RangeVariable: empty range");
        }
        std::vector<bool> m(range.size());
        for (size_t i = 0; i < range.size(); ++i) m[i] = range[i].has_value();
        return m;
    }
};

// Sorted, de-duplicated regular values followed by `*` when withStar is set.
template <class T>
std::vector<std::optional<T>> makeRange(const std::vector<T>& values, bool withStar) {
    const std::set<T> sorted(values.begin(), values.end());
    std::vector<std::optional<T>> out;
    out.reserve(sorted.size() + 1);
    for (const T& v : sorted) out.emplace_back(v);
    if (withStar) out.emplace_back(std::nullopt);
    return out;
}

} // namespace utils
