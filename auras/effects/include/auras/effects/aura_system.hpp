#pragma once

#include <auras/core/event_dispatcher.hpp>
#include <auras/core/object_handle.hpp>
#include <auras/core/settings.hpp>
#include <auras/core/timer.hpp>
#include <auras/core/uuid.hpp>
#include <auras/effects/aura_definition.hpp>
#include <auras/effects/aura_events.hpp>
#include <auras/effects/effect_definition.hpp>
#include <auras/effects/lifecycle_scheduler.hpp>
#include <auras/effects/object_state.hpp>
#include <auras/effects/value.hpp>
#include <functional>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace auras::effects {

// ============================================================================
// AuraSystem - Apply, remove and query auras on objects
// ============================================================================
//
// Every mutation of one object (register + recompute, remove + recompute,
// tick recompute) runs under that object's lock and recomputes each effect it
// touches exactly once. Objects are independent and may be driven from
// different threads. Appliers and reducers run under the object's lock and
// may call back into the system; such calls form nested batches.
//
// The registries and scheduler must outlive the system. Destroying the
// system cancels its timers without running any appliers.

class AuraSystem {
public:
    AuraSystem(const EffectRegistry& effects,
               const AuraRegistry& auras,
               core::IScheduler& scheduler,
               const core::Settings& settings = core::Settings{},
               core::EventDispatcher* dispatcher = &core::events());
    ~AuraSystem();

    AuraSystem(const AuraSystem&) = delete;
    AuraSystem& operator=(const AuraSystem&) = delete;

    // ========================================================================
    // Application
    // ========================================================================

    // Throws UnknownAuraError, UnknownEffectError, or InvalidSettingsError
    // (constructor failures are nested inside it). Nothing is registered
    // when it throws.
    core::UUID apply_aura(ObjectHandle object,
                          const std::string& aura_id,
                          const FieldMap& settings = {});

    // ========================================================================
    // Removal - missing ids/names are no-ops
    // ========================================================================

    bool remove_aura_instance(ObjectHandle object, const core::UUID& instance_id);

    // Removes every instance of the aura as one batch; returns the count
    size_t remove_aura(ObjectHandle object, const std::string& aura_id);

    size_t remove_all(ObjectHandle object);

    // remove_all on every object
    void clear();

    // ========================================================================
    // Queries
    // ========================================================================

    bool has_aura(ObjectHandle object, const std::string& aura_id) const;
    bool has_effect(ObjectHandle object, const std::string& effect_id) const;

    // Last value pushed for the effect, or its default when nothing is
    // active. Throws UnknownEffectError.
    Value get_effect_value(ObjectHandle object, const std::string& effect_id) const;

    // Aura id of every registered instance, registration order
    std::vector<std::string> get_auras(ObjectHandle object) const;
    std::vector<core::UUID> get_aura_instances(ObjectHandle object, const std::string& aura_id) const;

    size_t object_count() const { return m_states.size(); }
    size_t instance_count(ObjectHandle object) const;

    const LifecycleScheduler& lifecycle() const { return m_lifecycle; }

private:
    using StateLock = std::unique_lock<std::recursive_mutex>;
    using PendingEvent = std::variant<AuraAppliedEvent, AuraRemovedEvent, EffectRecomputedEvent>;

    std::shared_ptr<ObjectEffectState> lock_state(ObjectHandle object, StateLock& lock) const;
    std::shared_ptr<ObjectEffectState> lock_or_create_state(ObjectHandle object, StateLock& lock);

    // Cleanup pre-applies, unregistration, timer cancellation and one
    // recompute per touched effect. Caller holds the state's lock.
    size_t remove_batch(ObjectEffectState& state,
                        const std::vector<core::UUID>& instance_ids,
                        RemovalReason reason,
                        std::vector<PendingEvent>& events);

    using Selector = std::function<std::vector<core::UUID>(const ObjectEffectState&)>;

    // Locks the object, removes the selected instances as one batch and
    // publishes the resulting events
    size_t remove_selected(ObjectHandle object, RemovalReason reason, const Selector& select);

    // Drops the object's state once its last aura is gone. Caller holds
    // the state's lock.
    void release_if_empty(ObjectEffectState& state);

    Value recompute_effect(ObjectEffectState& state,
                           const std::string& effect_id,
                           RecomputeCause cause,
                           std::vector<PendingEvent>& events);

    void on_duration_expired(ObjectHandle object, const core::UUID& instance_id);
    void on_tick(ObjectHandle object, const core::UUID& instance_id, const std::string& effect_id);

    // Called with no object lock held
    void publish(std::vector<PendingEvent>& events);

    const EffectRegistry& m_effects;
    const AuraRegistry& m_auras;
    core::EventDispatcher* m_dispatcher;
    bool m_defer_events;

    EffectStateStore m_states;
    LifecycleScheduler m_lifecycle;
};

} // namespace auras::effects
