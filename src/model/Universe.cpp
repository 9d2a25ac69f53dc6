#include "model/Universe.h"

#include <stdexcept>

namespace model {

void Universe::register_(std::unique_ptr<ElementBase> e) {
    for (const ElementBase* a : e->args()) {
        if (a == nullptr) {
            throw std::invalid_argument("Universe::make: null parent of " + e->name());
        }
        if (a->universe() != this) {
            throw std::invalid_argument("Universe::make: parent " + a->name() + " of " + e->name() +
                                        " belongs to another universe");
        }
    }
    e->id_ = (int)elements_.size();
    e->universe_ = this;
    elements_.push_back(std::move(e));
}

std::vector<ElementBase*> Universe::elements() const {
    std::vector<ElementBase*> out;
    out.reserve(elements_.size());
    for (const auto& e : elements_) out.push_back(e.get());
    return out;
}

std::vector<ElementBase*> Universe::conditionedElements() const {
    std::vector<ElementBase*> out;
    for (const auto& e : elements_) {
        if (e->conditioned()) out.push_back(e.get());
    }
    return out;
}

std::vector<ElementBase*> Universe::constrainedElements() const {
    std::vector<ElementBase*> out;
    for (const auto& e : elements_) {
        if (e->constrained()) out.push_back(e.get());
    }
    return out;
}

} // namespace model
