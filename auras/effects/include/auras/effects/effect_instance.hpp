#pragma once

#include <auras/core/object_handle.hpp>
#include <auras/core/uuid.hpp>
#include <auras/effects/value.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace auras::effects {

// ============================================================================
// Reserved Fields - Lifecycle keys interpreted by the core
// ============================================================================

namespace reserved {

inline constexpr const char* Duration = "Duration";   // Seconds until the aura instance is removed
inline constexpr const char* Tick = "Tick";           // Seconds between forced recomputations
inline constexpr const char* Cleanup = "Cleanup";     // Extra apply without this instance on removal

} // namespace reserved

// ============================================================================
// EffectInstance - One contribution to an effect
// ============================================================================

struct EffectInstance {
    core::UUID aura_instance_id;        // Owning aura instance
    std::string effect_id;
    uint64_t sequence = 0;              // Registration order on the object

    FieldMap fields;                    // Instance-local fields merged with shared ones

    // ========================================================================
    // Field access
    // ========================================================================

    const Value& get(const std::string& key) const { return fields.get(key); }
    bool has(const std::string& key) const { return fields.contains(key); }
    double get_float(const std::string& key, double def = 0.0) const { return fields.get_float(key, def); }
    bool get_bool(const std::string& key, bool def = false) const { return fields.get_bool(key, def); }
    std::string get_string(const std::string& key, const std::string& def = "") const {
        return fields.get_string(key, def);
    }

    // ========================================================================
    // Reserved fields
    // ========================================================================

    // Present and positive; non-positive values mean "no timer"
    std::optional<float> duration() const;
    std::optional<float> tick() const;
    bool cleanup() const { return fields.get_bool(reserved::Cleanup); }

    // Throws InvalidSettingsError when a reserved field has the wrong type
    void validate_reserved_fields() const;
};

// ============================================================================
// AuraInstance - One application of an aura on an object
// ============================================================================

struct AuraInstance {
    core::UUID id;
    std::string aura_id;                // Defining aura
    ObjectHandle object = NullObject;

    FieldMap shared_fields;             // Replicated into every effect instance

    // At most one instance per effect id, in template order
    std::vector<EffectInstance> effect_instances;

    const EffectInstance* find_effect(const std::string& effect_id) const;
    bool touches(const std::string& effect_id) const { return find_effect(effect_id) != nullptr; }

    std::vector<std::string> effect_ids() const;
};

} // namespace auras::effects
