#pragma once
#include <vector>

#include "Factor.h"
#include "sbp/ComponentCollection.h"

namespace sbp {

// Element-to-factor conversion
class Factory {
public:
    // Multiplicative identity: no variables, one entry equal to semiring.one()
    static utils::Factor unit(const utils::Semiring& semiring);

    // Factors encoding the element's distribution given its parents
    static std::vector<utils::Factor> makeFactors(const ComponentCollection& cc, const model::ElementBase& e);

    // Observation and constraint factors; empty when the element has no evidence
    static std::vector<utils::Factor> makeEvidenceFactors(const ComponentCollection& cc, const model::ElementBase& e);
};

} // namespace sbp
