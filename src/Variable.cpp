// Variable.cpp
#include "Variable.h"

#include <algorithm>
#include <atomic>

namespace utils {

Variable::Variable(int id, std::string name, std::vector<bool> regular)
    : id_(id), name_(std::move(name)), regular_(std::move(regular)) {
    if (regular_.empty()) {
        throw std::runtime_error("Variable: empty range for " + name_);
    }
}

bool Variable::hasStar() const {
    return std::find(regular_.begin(), regular_.end(), false) != regular_.end();
}

int Variable::numRegular() const {
    return (int)std::count(regular_.begin(), regular_.end(), true);
}

std::string Variable::label(int i) const {
    return isRegular(i) ? std::to_string(i) : std::string("*");
}

int Variable::nextId() {
    static std::atomic<int> counter{0};
    return counter++;
}

} // namespace utils
