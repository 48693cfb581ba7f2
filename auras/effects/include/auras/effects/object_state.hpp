#pragma once

#include <auras/core/object_handle.hpp>
#include <auras/core/uuid.hpp>
#include <auras/effects/effect_instance.hpp>
#include <auras/effects/value.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace auras::effects {

// ============================================================================
// ObjectEffectState - Active auras of one object
// ============================================================================
//
// Owns the object's AuraInstances and keeps the per-effect active list in
// step with them: active(effect) is always the union of every registered
// aura's instances of that effect, ordered by registration sequence.
// Not synchronized itself; callers hold mutex() for every access.

class ObjectEffectState {
public:
    explicit ObjectEffectState(ObjectHandle object);

    ObjectEffectState(const ObjectEffectState&) = delete;
    ObjectEffectState& operator=(const ObjectEffectState&) = delete;

    ObjectHandle object() const { return m_object; }

    // ========================================================================
    // Registration
    // ========================================================================

    // Assigns sequence numbers to the contained effect instances and adds
    // them to the active lists
    const AuraInstance& add(std::unique_ptr<AuraInstance> aura);

    // nullptr if not registered
    std::unique_ptr<AuraInstance> remove(const core::UUID& aura_instance_id);

    // ========================================================================
    // Queries
    // ========================================================================

    const AuraInstance* find(const core::UUID& aura_instance_id) const;
    bool contains(const core::UUID& aura_instance_id) const { return find(aura_instance_id) != nullptr; }

    bool has_aura(const std::string& aura_id) const;
    std::vector<core::UUID> instances_of(const std::string& aura_id) const;
    std::vector<core::UUID> all_instances() const;

    // One entry per registered instance, registration order
    std::vector<std::string> aura_ids() const;

    // Ordered by registration sequence; empty list if none
    const std::vector<const EffectInstance*>& active(const std::string& effect_id) const;
    bool has_effect(const std::string& effect_id) const { return !active(effect_id).empty(); }

    size_t aura_count() const { return m_auras.size(); }
    bool empty() const { return m_auras.empty(); }

    // ========================================================================
    // Applied values
    // ========================================================================

    // Last value passed to the effect's applier on this object
    void set_value(const std::string& effect_id, Value value);
    const Value* last_value(const std::string& effect_id) const;

    // ========================================================================
    // Synchronization
    // ========================================================================

    // Recursive so appliers may query the object they are applied to
    std::recursive_mutex& mutex() const { return m_mutex; }

    // Set once the store has dropped this state; holders must re-acquire
    bool detached() const { return m_detached; }
    void detach() { m_detached = true; }

private:
    ObjectHandle m_object;
    std::vector<std::unique_ptr<AuraInstance>> m_auras;     // Registration order
    std::unordered_map<std::string, std::vector<const EffectInstance*>> m_active;
    std::unordered_map<std::string, Value> m_values;
    uint64_t m_next_sequence = 1;
    bool m_detached = false;

    mutable std::recursive_mutex m_mutex;
};

// ============================================================================
// EffectStateStore - Object handle -> ObjectEffectState
// ============================================================================

class EffectStateStore {
public:
    EffectStateStore() = default;

    EffectStateStore(const EffectStateStore&) = delete;
    EffectStateStore& operator=(const EffectStateStore&) = delete;

    std::shared_ptr<ObjectEffectState> find(ObjectHandle object) const;
    std::shared_ptr<ObjectEffectState> find_or_create(ObjectHandle object);

    // Drops the mapping if it still points at `state` and detaches it.
    // Caller holds state.mutex().
    void destroy(ObjectEffectState& state);

    std::vector<ObjectHandle> objects() const;
    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<ObjectHandle, std::shared_ptr<ObjectEffectState>> m_states;
};

} // namespace auras::effects
