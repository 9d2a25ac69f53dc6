#pragma once

#include <stdexcept>
#include <string>

namespace sbp {

// Invalid algorithm construction; returned by StructuredBP::create
class ConfigurationError : public std::runtime_error {
public:
    enum class Code { EmptyTargets, MultipleUniverses, InvalidIterations, InvalidSetting };

    ConfigurationError(Code code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    Code code() const { return code_; }

private:
    Code code_;
};

// A query target is not a dimension of the assembled joint factor
class UnreachableTargetError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A target marginal has zero (or non-finite) total mass
class DegenerateNormalizationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace sbp
