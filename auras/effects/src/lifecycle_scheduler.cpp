#include <auras/effects/lifecycle_scheduler.hpp>
#include <auras/core/log.hpp>
#include <algorithm>

namespace auras::effects {

const char* timer_kind_name(TimerKind kind) {
    switch (kind) {
        case TimerKind::Duration: return "Duration";
        case TimerKind::Tick: return "Tick";
    }
    return "Unknown";
}

const char* timer_state_name(TimerState state) {
    switch (state) {
        case TimerState::Armed: return "Armed";
        case TimerState::Fired: return "Fired";
        case TimerState::Cancelled: return "Cancelled";
        case TimerState::Expired: return "Expired";
    }
    return "Unknown";
}

// ============================================================================
// LifecycleScheduler Implementation
// ============================================================================

LifecycleScheduler::LifecycleScheduler(core::IScheduler& scheduler, float min_tick_interval)
    : m_scheduler(scheduler)
    , m_min_tick_interval(min_tick_interval) {}

LifecycleScheduler::~LifecycleScheduler() {
    cancel_all();
}

size_t LifecycleScheduler::arm(const AuraInstance& aura) {
    size_t armed = 0;

    for (const auto& instance : aura.effect_instances) {
        if (auto duration = instance.duration()) {
            add_entry(aura.object, aura.id, instance.effect_id, TimerKind::Duration, *duration);
            ++armed;
        }

        if (auto tick = instance.tick()) {
            float interval = *tick;
            if (interval < m_min_tick_interval) {
                core::log(core::LogLevel::Warn,
                          "[Lifecycle] Tick {}s on '{}' ({}) is below {}s, clamping",
                          interval, instance.effect_id, aura.aura_id, m_min_tick_interval);
                interval = m_min_tick_interval;
            }
            add_entry(aura.object, aura.id, instance.effect_id, TimerKind::Tick, interval);
            ++armed;
        }
    }

    return armed;
}

uint64_t LifecycleScheduler::add_entry(ObjectHandle object, const core::UUID& aura_instance_id,
                                       const std::string& effect_id, TimerKind kind, float seconds) {
    std::lock_guard<std::mutex> lock(m_mutex);

    uint64_t entry_id = m_next_id++;

    LifecycleEntry entry;
    entry.id = entry_id;
    entry.object = object;
    entry.aura_instance_id = aura_instance_id;
    entry.effect_id = effect_id;
    entry.kind = kind;
    entry.seconds = seconds;

    auto callback = [this, entry_id]() { on_timer(entry_id); };
    entry.timer = kind == TimerKind::Duration
        ? m_scheduler.set_timeout(seconds, std::move(callback))
        : m_scheduler.set_interval(seconds, std::move(callback));

    core::log(core::LogLevel::Trace, "[Lifecycle] Armed {} {}s for '{}' on {}",
              timer_kind_name(kind), seconds, effect_id, aura_instance_id.to_string());

    m_entries.emplace(entry_id, std::move(entry));
    m_by_aura[aura_instance_id].push_back(entry_id);
    return entry_id;
}

size_t LifecycleScheduler::cancel(const core::UUID& aura_instance_id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_by_aura.find(aura_instance_id);
    if (it == m_by_aura.end()) {
        return 0;
    }

    size_t cancelled = 0;
    for (uint64_t entry_id : it->second) {
        auto entry_it = m_entries.find(entry_id);
        if (entry_it == m_entries.end()) continue;

        LifecycleEntry& entry = entry_it->second;
        m_scheduler.cancel(entry.timer);
        if (entry.state == TimerState::Armed || entry.state == TimerState::Fired) {
            ++cancelled;
        }
        entry.state = TimerState::Cancelled;
        m_entries.erase(entry_it);
    }

    m_by_aura.erase(it);
    return cancelled;
}

void LifecycleScheduler::cancel_all() {
    std::lock_guard<std::mutex> lock(m_mutex);

    for (auto& [entry_id, entry] : m_entries) {
        m_scheduler.cancel(entry.timer);
    }
    m_entries.clear();
    m_by_aura.clear();
}

void LifecycleScheduler::on_timer(uint64_t entry_id) {
    ObjectHandle object = NullObject;
    core::UUID aura_instance_id;
    std::string effect_id;
    TimerKind kind = TimerKind::Duration;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_entries.find(entry_id);
        if (it == m_entries.end() || it->second.state == TimerState::Cancelled) {
            return;
        }

        LifecycleEntry& entry = it->second;
        entry.state = TimerState::Fired;
        ++entry.fire_count;

        object = entry.object;
        aura_instance_id = entry.aura_instance_id;
        effect_id = entry.effect_id;
        kind = entry.kind;
    }

    // Settles the entry whether or not the handler throws: a Duration entry
    // always ends, a Tick entry goes back to Armed for its next interval
    auto settle = [this, entry_id, kind]() {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(entry_id);
        if (it == m_entries.end()) {
            return;
        }
        if (kind == TimerKind::Duration) {
            it->second.state = TimerState::Expired;
            erase_entry(entry_id);
        } else if (it->second.state == TimerState::Fired) {
            it->second.state = TimerState::Armed;
        }
    };

    try {
        if (kind == TimerKind::Duration) {
            core::log(core::LogLevel::Debug, "[Lifecycle] Duration of '{}' expired on {}",
                      effect_id, aura_instance_id.to_string());
            if (m_on_expire) {
                m_on_expire(object, aura_instance_id);
            }
        } else if (m_on_tick) {
            m_on_tick(object, aura_instance_id, effect_id);
        }
    } catch (...) {
        settle();
        throw;
    }

    settle();
}

void LifecycleScheduler::erase_entry(uint64_t entry_id) {
    auto it = m_entries.find(entry_id);
    if (it == m_entries.end()) {
        return;
    }

    auto aura_it = m_by_aura.find(it->second.aura_instance_id);
    if (aura_it != m_by_aura.end()) {
        auto& ids = aura_it->second;
        ids.erase(std::remove(ids.begin(), ids.end(), entry_id), ids.end());
        if (ids.empty()) {
            m_by_aura.erase(aura_it);
        }
    }

    m_entries.erase(it);
}

// ============================================================================
// Queries
// ============================================================================

std::vector<LifecycleEntry> LifecycleScheduler::entries_for(const core::UUID& aura_instance_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<LifecycleEntry> result;
    auto it = m_by_aura.find(aura_instance_id);
    if (it == m_by_aura.end()) {
        return result;
    }

    for (uint64_t entry_id : it->second) {
        auto entry_it = m_entries.find(entry_id);
        if (entry_it != m_entries.end()) {
            result.push_back(entry_it->second);
        }
    }
    return result;
}

std::optional<TimerState> LifecycleScheduler::state(uint64_t entry_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(entry_id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

size_t LifecycleScheduler::armed_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    return static_cast<size_t>(std::count_if(m_entries.begin(), m_entries.end(),
        [](const auto& pair) { return pair.second.state == TimerState::Armed; }));
}

size_t LifecycleScheduler::entry_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

} // namespace auras::effects
