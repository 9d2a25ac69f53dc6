#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "model/Element.h"

namespace model {

/**
 * A self-contained model: owns its elements, in creation order.
 *
 * Usage:
 *   model::Universe u;
 *   auto* a = u.make<model::Flip>("a", 0.3);
 *   auto* b = u.make<model::Apply<bool, bool>>("b", a, [](const bool& x) { return x; });
 */
class Universe {
public:
    Universe() = default;
    Universe(const Universe&) = delete;
    Universe& operator=(const Universe&) = delete;

    template <class E, class... Args>
    E* make(Args&&... args) {
        auto e = std::make_unique<E>(std::forward<Args>(args)...);
        E* raw = e.get();
        register_(std::move(e));
        return raw;
    }

    int numElements() const { return (int)elements_.size(); }
    std::vector<ElementBase*> elements() const;

    // Elements with a hard observation
    std::vector<ElementBase*> conditionedElements() const;
    // Elements with at least one soft constraint
    std::vector<ElementBase*> constrainedElements() const;

private:
    std::vector<std::unique_ptr<ElementBase>> elements_;

    void register_(std::unique_ptr<ElementBase> e);
};

} // namespace model
