#include <auras/effects/aura_system.hpp>
#include <auras/effects/effect_calculator.hpp>
#include <auras/effects/errors.hpp>
#include <auras/core/log.hpp>
#include <algorithm>
#include <exception>
#include <unordered_set>

namespace auras::effects {

const char* removal_reason_name(RemovalReason reason) {
    switch (reason) {
        case RemovalReason::Cancelled: return "Cancelled";
        case RemovalReason::Expired: return "Expired";
        case RemovalReason::Cleared: return "Cleared";
    }
    return "Unknown";
}

const char* recompute_cause_name(RecomputeCause cause) {
    switch (cause) {
        case RecomputeCause::Apply: return "Apply";
        case RecomputeCause::Remove: return "Remove";
        case RecomputeCause::Tick: return "Tick";
        case RecomputeCause::Cleanup: return "Cleanup";
    }
    return "Unknown";
}

namespace {

template<typename Lookup>
std::shared_ptr<ObjectEffectState> acquire(Lookup&& lookup, std::unique_lock<std::recursive_mutex>& lock) {
    // A state detached between lookup and lock has been dropped from the
    // store; look the object up again
    for (;;) {
        std::shared_ptr<ObjectEffectState> state = lookup();
        if (!state) {
            return nullptr;
        }

        std::unique_lock<std::recursive_mutex> candidate(state->mutex());
        if (!state->detached()) {
            lock = std::move(candidate);
            return state;
        }
    }
}

} // anonymous namespace

// ============================================================================
// AuraSystem Implementation
// ============================================================================

AuraSystem::AuraSystem(const EffectRegistry& effects,
                       const AuraRegistry& auras,
                       core::IScheduler& scheduler,
                       const core::Settings& settings,
                       core::EventDispatcher* dispatcher)
    : m_effects(effects)
    , m_auras(auras)
    , m_dispatcher(dispatcher)
    , m_defer_events(settings.events.defer_events)
    , m_lifecycle(scheduler, settings.lifecycle.min_tick_interval) {
    m_lifecycle.set_on_expire([this](ObjectHandle object, const core::UUID& instance_id) {
        on_duration_expired(object, instance_id);
    });
    m_lifecycle.set_on_tick([this](ObjectHandle object, const core::UUID& instance_id,
                                   const std::string& effect_id) {
        on_tick(object, instance_id, effect_id);
    });
}

AuraSystem::~AuraSystem() {
    m_lifecycle.cancel_all();
}

std::shared_ptr<ObjectEffectState> AuraSystem::lock_state(ObjectHandle object, StateLock& lock) const {
    return acquire([this, object]() { return m_states.find(object); }, lock);
}

std::shared_ptr<ObjectEffectState> AuraSystem::lock_or_create_state(ObjectHandle object, StateLock& lock) {
    return acquire([this, object]() { return m_states.find_or_create(object); }, lock);
}

// ============================================================================
// Application
// ============================================================================

core::UUID AuraSystem::apply_aura(ObjectHandle object,
                                  const std::string& aura_id,
                                  const FieldMap& settings) {
    const AuraDefinition& def = m_auras.get(aura_id);

    AuraTemplate tmpl;
    try {
        tmpl = def.constructor->construct(settings);
    } catch (const InvalidSettingsError&) {
        throw;
    } catch (const std::exception& e) {
        std::throw_with_nested(InvalidSettingsError(
            "Aura '" + aura_id + "' rejected its settings: " + e.what()));
    }

    auto aura = std::make_unique<AuraInstance>();
    aura->id = core::UUID::generate();
    aura->aura_id = aura_id;
    aura->object = object;
    aura->shared_fields = std::move(tmpl.shared_fields);

    // Resolve and validate everything before any state is touched
    for (auto& [effect_id, fields] : tmpl.effect_instances) {
        if (!m_effects.exists(effect_id)) {
            throw UnknownEffectError(effect_id);
        }
        if (aura->find_effect(effect_id)) {
            throw InvalidSettingsError(
                "Aura '" + aura_id + "' lists effect '" + effect_id + "' more than once");
        }

        EffectInstance instance;
        instance.aura_instance_id = aura->id;
        instance.effect_id = effect_id;
        instance.fields = std::move(fields);
        instance.fields.merge_missing(aura->shared_fields);
        instance.validate_reserved_fields();

        aura->effect_instances.push_back(std::move(instance));
    }

    core::UUID instance_id = aura->id;
    std::vector<PendingEvent> events;

    {
        StateLock lock;
        auto state = lock_or_create_state(object, lock);

        const AuraInstance& registered = state->add(std::move(aura));
        m_lifecycle.arm(registered);

        std::vector<std::string> effect_ids = registered.effect_ids();
        events.push_back(AuraAppliedEvent{object, aura_id, instance_id, effect_ids});

        core::log(core::LogLevel::Debug, "[Auras] Applied '{}' ({}) to object {}",
                  aura_id, instance_id.to_string(), object_id(object));

        // At most one instance per effect, so each touched effect recomputes once
        for (const auto& effect_id : effect_ids) {
            recompute_effect(*state, effect_id, RecomputeCause::Apply, events);
        }
    }

    publish(events);
    return instance_id;
}

// ============================================================================
// Removal
// ============================================================================

bool AuraSystem::remove_aura_instance(ObjectHandle object, const core::UUID& instance_id) {
    return remove_selected(object, RemovalReason::Cancelled,
        [&instance_id](const ObjectEffectState&) { return std::vector<core::UUID>{instance_id}; }) > 0;
}

size_t AuraSystem::remove_aura(ObjectHandle object, const std::string& aura_id) {
    return remove_selected(object, RemovalReason::Cancelled,
        [&aura_id](const ObjectEffectState& state) { return state.instances_of(aura_id); });
}

size_t AuraSystem::remove_all(ObjectHandle object) {
    return remove_selected(object, RemovalReason::Cleared,
        [](const ObjectEffectState& state) { return state.all_instances(); });
}

void AuraSystem::clear() {
    size_t removed = 0;
    for (ObjectHandle object : m_states.objects()) {
        removed += remove_all(object);
    }
    core::log(core::LogLevel::Debug, "[Auras] Cleared {} aura instances", removed);
}

size_t AuraSystem::remove_selected(ObjectHandle object, RemovalReason reason, const Selector& select) {
    std::vector<PendingEvent> events;
    size_t removed = 0;

    {
        StateLock lock;
        auto state = lock_state(object, lock);
        if (!state) {
            return 0;
        }

        try {
            removed = remove_batch(*state, select(*state), reason, events);
        } catch (...) {
            release_if_empty(*state);
            throw;
        }
        release_if_empty(*state);
    }

    publish(events);
    return removed;
}

size_t AuraSystem::remove_batch(ObjectEffectState& state,
                                const std::vector<core::UUID>& instance_ids,
                                RemovalReason reason,
                                std::vector<PendingEvent>& events) {
    std::vector<core::UUID> batch;
    for (const auto& id : instance_ids) {
        if (state.contains(id) && std::find(batch.begin(), batch.end(), id) == batch.end()) {
            batch.push_back(id);
        }
    }

    if (batch.empty()) {
        return 0;
    }

    ObjectHandle object = state.object();

    // Cleanup pre-applies: each sees the active set without every instance
    // removed so far in this batch, its own aura included. Appliers may
    // re-enter, so the aura is looked up again before each step.
    EffectCalculator::ExcludedSet excluded;
    for (const auto& id : batch) {
        const AuraInstance* aura = state.find(id);
        if (!aura) continue;

        for (const auto& instance : aura->effect_instances) {
            excluded.insert(&instance);
        }

        for (size_t i = 0;; ++i) {
            aura = state.find(id);
            if (!aura || i >= aura->effect_instances.size()) break;

            const EffectInstance& instance = aura->effect_instances[i];
            if (!instance.cleanup()) continue;

            std::string effect_id = instance.effect_id;
            const EffectDefinition& effect = m_effects.get(effect_id);
            EffectCalculator::InstanceList active = state.active(effect_id);
            Value value = EffectCalculator::recompute(object, effect, active, &excluded);

            events.push_back(EffectRecomputedEvent{object, effect_id, std::move(value),
                EffectCalculator::count_contributing(active, &excluded), RecomputeCause::Cleanup});
        }
    }

    // Unregister and cancel timers; collect touched effects in first-touch order
    std::vector<std::string> touched;
    std::unordered_set<std::string> touched_set;
    std::vector<std::unique_ptr<AuraInstance>> removed;
    removed.reserve(batch.size());

    for (const auto& id : batch) {
        m_lifecycle.cancel(id);

        std::unique_ptr<AuraInstance> owned = state.remove(id);
        if (!owned) continue;

        for (const auto& instance : owned->effect_instances) {
            if (touched_set.insert(instance.effect_id).second) {
                touched.push_back(instance.effect_id);
            }
        }

        events.push_back(AuraRemovedEvent{object, owned->aura_id, id, reason});
        core::log(core::LogLevel::Debug, "[Auras] Removed '{}' ({}) from object {} ({})",
                  owned->aura_id, id.to_string(), object_id(object), removal_reason_name(reason));

        removed.push_back(std::move(owned));
    }

    for (const auto& effect_id : touched) {
        recompute_effect(state, effect_id, RecomputeCause::Remove, events);
    }

    return removed.size();
}

void AuraSystem::release_if_empty(ObjectEffectState& state) {
    if (state.empty()) {
        m_states.destroy(state);
    }
}

Value AuraSystem::recompute_effect(ObjectEffectState& state,
                                   const std::string& effect_id,
                                   RecomputeCause cause,
                                   std::vector<PendingEvent>& events) {
    const EffectDefinition& effect = m_effects.get(effect_id);

    // Copy: an applier calling back into this object may change the list
    EffectCalculator::InstanceList active = state.active(effect_id);
    Value value = EffectCalculator::recompute(state.object(), effect, active);
    state.set_value(effect_id, value);

    events.push_back(EffectRecomputedEvent{state.object(), effect_id, value, active.size(), cause});
    return value;
}

// ============================================================================
// Timer Handlers
// ============================================================================

void AuraSystem::on_duration_expired(ObjectHandle object, const core::UUID& instance_id) {
    std::vector<PendingEvent> events;

    {
        StateLock lock;
        auto state = lock_state(object, lock);
        if (!state || !state->contains(instance_id)) {
            core::log(core::LogLevel::Trace, "[Auras] Ignoring expiry of removed instance {}",
                      instance_id.to_string());
            return;
        }

        try {
            remove_batch(*state, {instance_id}, RemovalReason::Expired, events);
        } catch (...) {
            release_if_empty(*state);
            throw;
        }
        release_if_empty(*state);
    }

    publish(events);
}

void AuraSystem::on_tick(ObjectHandle object, const core::UUID& instance_id, const std::string& effect_id) {
    std::vector<PendingEvent> events;

    {
        StateLock lock;
        auto state = lock_state(object, lock);
        if (!state || !state->contains(instance_id)) {
            return;
        }

        recompute_effect(*state, effect_id, RecomputeCause::Tick, events);
    }

    publish(events);
}

// ============================================================================
// Queries
// ============================================================================

bool AuraSystem::has_aura(ObjectHandle object, const std::string& aura_id) const {
    StateLock lock;
    auto state = lock_state(object, lock);
    return state && state->has_aura(aura_id);
}

bool AuraSystem::has_effect(ObjectHandle object, const std::string& effect_id) const {
    StateLock lock;
    auto state = lock_state(object, lock);
    return state && state->has_effect(effect_id);
}

Value AuraSystem::get_effect_value(ObjectHandle object, const std::string& effect_id) const {
    const EffectDefinition& effect = m_effects.get(effect_id);

    StateLock lock;
    auto state = lock_state(object, lock);
    if (!state) {
        return effect.default_value;
    }

    const Value* value = state->last_value(effect_id);
    return value ? *value : effect.default_value;
}

std::vector<std::string> AuraSystem::get_auras(ObjectHandle object) const {
    StateLock lock;
    auto state = lock_state(object, lock);
    return state ? state->aura_ids() : std::vector<std::string>{};
}

std::vector<core::UUID> AuraSystem::get_aura_instances(ObjectHandle object, const std::string& aura_id) const {
    StateLock lock;
    auto state = lock_state(object, lock);
    return state ? state->instances_of(aura_id) : std::vector<core::UUID>{};
}

size_t AuraSystem::instance_count(ObjectHandle object) const {
    StateLock lock;
    auto state = lock_state(object, lock);
    return state ? state->aura_count() : 0;
}

// ============================================================================
// Events
// ============================================================================

void AuraSystem::publish(std::vector<PendingEvent>& events) {
    if (!m_dispatcher) {
        return;
    }

    for (auto& event : events) {
        std::visit([this](auto& e) {
            if (m_defer_events) {
                m_dispatcher->queue(std::move(e));
            } else {
                m_dispatcher->dispatch(e);
            }
        }, event);
    }
}

} // namespace auras::effects
