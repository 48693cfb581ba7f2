#pragma once

#include <auras/core/object_handle.hpp>
#include <auras/core/uuid.hpp>
#include <auras/effects/value.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace auras::effects {

enum class RemovalReason : uint8_t {
    Cancelled,  // remove_aura_instance / remove_aura
    Expired,    // Duration ran out
    Cleared     // remove_all / clear
};

enum class RecomputeCause : uint8_t {
    Apply,
    Remove,
    Tick,
    Cleanup     // Pre-removal apply excluding the instances being removed
};

const char* removal_reason_name(RemovalReason reason);
const char* recompute_cause_name(RecomputeCause cause);

// ============================================================================
// Aura Events
// ============================================================================

// Aura instance registered on an object
struct AuraAppliedEvent {
    ObjectHandle object;
    std::string aura_id;
    core::UUID instance_id;
    std::vector<std::string> effect_ids;
};

// Aura instance unregistered from an object
struct AuraRemovedEvent {
    ObjectHandle object;
    std::string aura_id;
    core::UUID instance_id;
    RemovalReason reason;
};

// ============================================================================
// Effect Events
// ============================================================================

// An effect was folded and pushed through its applier
struct EffectRecomputedEvent {
    ObjectHandle object;
    std::string effect_id;
    Value value;
    size_t active_count;        // Instances that took part in the fold
    RecomputeCause cause;
};

} // namespace auras::effects
