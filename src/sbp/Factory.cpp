#include "sbp/Factory.h"

namespace sbp {

utils::Factor Factory::unit(const utils::Semiring& semiring) {
    return utils::Factor::unit(semiring);
}

std::vector<utils::Factor> Factory::makeFactors(const ComponentCollection& cc, const model::ElementBase& e) {
    return e.makeFactors(cc);
}

std::vector<utils::Factor> Factory::makeEvidenceFactors(const ComponentCollection& cc, const model::ElementBase& e) {
    if (!e.conditioned() && !e.constrained()) return {};
    return e.makeEvidenceFactors(cc);
}

} // namespace sbp
