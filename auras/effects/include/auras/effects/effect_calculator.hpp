#pragma once

#include <auras/core/object_handle.hpp>
#include <auras/effects/effect_definition.hpp>
#include <auras/effects/effect_instance.hpp>
#include <auras/effects/value.hpp>
#include <unordered_set>
#include <vector>

namespace auras::effects {

// ============================================================================
// EffectCalculator - Reduce/apply pipeline
// ============================================================================

class EffectCalculator {
public:
    using InstanceList = std::vector<const EffectInstance*>;
    using ExcludedSet = std::unordered_set<const EffectInstance*>;

    // Fold the reducer from the effect default over the instances in order,
    // skipping any in `excluded`
    static Value fold(const EffectDefinition& effect,
                      const InstanceList& instances,
                      const ExcludedSet* excluded = nullptr);

    // Fold, then push the result through the applier (if the effect has one).
    // Reducer and applier exceptions propagate.
    static Value recompute(ObjectHandle object,
                           const EffectDefinition& effect,
                           const InstanceList& instances,
                           const ExcludedSet* excluded = nullptr);

    // Number of instances that take part in the fold
    static size_t count_contributing(const InstanceList& instances,
                                     const ExcludedSet* excluded = nullptr);
};

} // namespace auras::effects
