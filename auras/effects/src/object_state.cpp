#include <auras/effects/object_state.hpp>
#include <algorithm>

namespace auras::effects {

// ============================================================================
// ObjectEffectState Implementation
// ============================================================================

ObjectEffectState::ObjectEffectState(ObjectHandle object)
    : m_object(object) {}

const AuraInstance& ObjectEffectState::add(std::unique_ptr<AuraInstance> aura) {
    for (auto& instance : aura->effect_instances) {
        instance.sequence = m_next_sequence++;
        instance.aura_instance_id = aura->id;
    }

    // Sequence numbers only grow, so appending keeps each list ordered
    for (const auto& instance : aura->effect_instances) {
        m_active[instance.effect_id].push_back(&instance);
    }

    m_auras.push_back(std::move(aura));
    return *m_auras.back();
}

std::unique_ptr<AuraInstance> ObjectEffectState::remove(const core::UUID& aura_instance_id) {
    auto it = std::find_if(m_auras.begin(), m_auras.end(),
        [&aura_instance_id](const auto& aura) { return aura->id == aura_instance_id; });
    if (it == m_auras.end()) {
        return nullptr;
    }

    std::unique_ptr<AuraInstance> aura = std::move(*it);
    m_auras.erase(it);

    for (const auto& instance : aura->effect_instances) {
        auto active_it = m_active.find(instance.effect_id);
        if (active_it == m_active.end()) continue;

        auto& list = active_it->second;
        list.erase(std::remove(list.begin(), list.end(), &instance), list.end());
        if (list.empty()) {
            m_active.erase(active_it);
        }
    }

    return aura;
}

const AuraInstance* ObjectEffectState::find(const core::UUID& aura_instance_id) const {
    for (const auto& aura : m_auras) {
        if (aura->id == aura_instance_id) {
            return aura.get();
        }
    }
    return nullptr;
}

bool ObjectEffectState::has_aura(const std::string& aura_id) const {
    return std::any_of(m_auras.begin(), m_auras.end(),
        [&aura_id](const auto& aura) { return aura->aura_id == aura_id; });
}

std::vector<core::UUID> ObjectEffectState::instances_of(const std::string& aura_id) const {
    std::vector<core::UUID> result;
    for (const auto& aura : m_auras) {
        if (aura->aura_id == aura_id) {
            result.push_back(aura->id);
        }
    }
    return result;
}

std::vector<core::UUID> ObjectEffectState::all_instances() const {
    std::vector<core::UUID> result;
    result.reserve(m_auras.size());
    for (const auto& aura : m_auras) {
        result.push_back(aura->id);
    }
    return result;
}

std::vector<std::string> ObjectEffectState::aura_ids() const {
    std::vector<std::string> result;
    result.reserve(m_auras.size());
    for (const auto& aura : m_auras) {
        result.push_back(aura->aura_id);
    }
    return result;
}

const std::vector<const EffectInstance*>& ObjectEffectState::active(const std::string& effect_id) const {
    static const std::vector<const EffectInstance*> s_empty;
    auto it = m_active.find(effect_id);
    return it != m_active.end() ? it->second : s_empty;
}

void ObjectEffectState::set_value(const std::string& effect_id, Value value) {
    m_values[effect_id] = std::move(value);
}

const Value* ObjectEffectState::last_value(const std::string& effect_id) const {
    auto it = m_values.find(effect_id);
    return it != m_values.end() ? &it->second : nullptr;
}

// ============================================================================
// EffectStateStore Implementation
// ============================================================================

std::shared_ptr<ObjectEffectState> EffectStateStore::find(ObjectHandle object) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_states.find(object);
    return it != m_states.end() ? it->second : nullptr;
}

std::shared_ptr<ObjectEffectState> EffectStateStore::find_or_create(ObjectHandle object) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& state = m_states[object];
    if (!state) {
        state = std::make_shared<ObjectEffectState>(object);
    }
    return state;
}

void EffectStateStore::destroy(ObjectEffectState& state) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_states.find(state.object());
    if (it != m_states.end() && it->second.get() == &state) {
        m_states.erase(it);
    }
    state.detach();
}

std::vector<ObjectHandle> EffectStateStore::objects() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ObjectHandle> result;
    result.reserve(m_states.size());
    for (const auto& [object, state] : m_states) {
        result.push_back(object);
    }
    return result;
}

size_t EffectStateStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_states.size();
}

} // namespace auras::effects
