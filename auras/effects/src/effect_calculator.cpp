#include <auras/effects/effect_calculator.hpp>

namespace auras::effects {

namespace {

bool is_excluded(const EffectInstance* instance, const EffectCalculator::ExcludedSet* excluded) {
    return excluded && excluded->count(instance) > 0;
}

} // anonymous namespace

Value EffectCalculator::fold(const EffectDefinition& effect,
                             const InstanceList& instances,
                             const ExcludedSet* excluded) {
    Value result = effect.default_value;

    for (const EffectInstance* instance : instances) {
        if (is_excluded(instance, excluded)) continue;
        result = effect.reducer->reduce(result, *instance);
    }

    return result;
}

Value EffectCalculator::recompute(ObjectHandle object,
                                  const EffectDefinition& effect,
                                  const InstanceList& instances,
                                  const ExcludedSet* excluded) {
    Value value = fold(effect, instances, excluded);

    if (effect.applier) {
        effect.applier->apply(object, value);
    }

    return value;
}

size_t EffectCalculator::count_contributing(const InstanceList& instances,
                                            const ExcludedSet* excluded) {
    size_t count = 0;
    for (const EffectInstance* instance : instances) {
        if (!is_excluded(instance, excluded)) {
            ++count;
        }
    }
    return count;
}

} // namespace auras::effects
