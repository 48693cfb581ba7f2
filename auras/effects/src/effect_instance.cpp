#include <auras/effects/effect_instance.hpp>
#include <auras/effects/errors.hpp>

namespace auras::effects {

namespace {

std::optional<float> positive_seconds(const FieldMap& map, const char* key) {
    const Value* value = map.find(key);
    if (!value || !value->is_numeric()) {
        return std::nullopt;
    }

    double seconds = value->as_float();
    if (seconds <= 0.0) {
        return std::nullopt;
    }
    return static_cast<float>(seconds);
}

void require_type(const EffectInstance& instance, const char* key, bool ok, const char* expected) {
    if (ok) return;
    throw InvalidSettingsError(
        "Field '" + std::string(key) + "' of effect '" + instance.effect_id +
        "' must be " + expected + ", got " + Value::type_name(instance.get(key).type()));
}

} // anonymous namespace

// ============================================================================
// EffectInstance Implementation
// ============================================================================

std::optional<float> EffectInstance::duration() const {
    return positive_seconds(fields, reserved::Duration);
}

std::optional<float> EffectInstance::tick() const {
    return positive_seconds(fields, reserved::Tick);
}

void EffectInstance::validate_reserved_fields() const {
    if (const Value* v = fields.find(reserved::Duration)) {
        require_type(*this, reserved::Duration, v->is_numeric(), "a number");
    }
    if (const Value* v = fields.find(reserved::Tick)) {
        require_type(*this, reserved::Tick, v->is_numeric(), "a number");
    }
    if (const Value* v = fields.find(reserved::Cleanup)) {
        require_type(*this, reserved::Cleanup, v->is_bool(), "a bool");
    }
}

// ============================================================================
// AuraInstance Implementation
// ============================================================================

const EffectInstance* AuraInstance::find_effect(const std::string& effect_id) const {
    for (const auto& instance : effect_instances) {
        if (instance.effect_id == effect_id) {
            return &instance;
        }
    }
    return nullptr;
}

std::vector<std::string> AuraInstance::effect_ids() const {
    std::vector<std::string> result;
    result.reserve(effect_instances.size());
    for (const auto& instance : effect_instances) {
        result.push_back(instance.effect_id);
    }
    return result;
}

} // namespace auras::effects
