#pragma once

#include <auras/core/object_handle.hpp>
#include <auras/core/timer.hpp>
#include <auras/core/uuid.hpp>
#include <auras/effects/effect_instance.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace auras::effects {

// ============================================================================
// Lifecycle Entry - One Duration or Tick timer of an effect instance
// ============================================================================

enum class TimerKind : uint8_t {
    Duration,   // One-shot; removes the owning aura instance
    Tick        // Repeating; recomputes the owning effect
};

enum class TimerState : uint8_t {
    Armed,
    Fired,      // Handler running
    Cancelled,  // Terminal
    Expired     // Terminal (Duration only)
};

struct LifecycleEntry {
    uint64_t id = 0;
    ObjectHandle object = NullObject;
    core::UUID aura_instance_id;
    std::string effect_id;
    TimerKind kind = TimerKind::Duration;
    float seconds = 0.0f;
    core::TimerHandle timer;
    TimerState state = TimerState::Armed;
    uint32_t fire_count = 0;
};

const char* timer_kind_name(TimerKind kind);
const char* timer_state_name(TimerState state);

// ============================================================================
// LifecycleScheduler - Duration/Tick timers per aura instance
// ============================================================================
//
// Handlers run on whichever thread pumps the IScheduler, with no scheduler
// lock held. A handler never runs for an entry that was cancelled first, but
// it may still find its aura instance gone (removed between fire and lock),
// so handlers re-check registration against the object state.

class LifecycleScheduler {
public:
    using ExpireHandler = std::function<void(ObjectHandle, const core::UUID& aura_instance_id)>;
    using TickHandler = std::function<void(ObjectHandle, const core::UUID& aura_instance_id,
                                           const std::string& effect_id)>;

    LifecycleScheduler(core::IScheduler& scheduler, float min_tick_interval = 0.01f);
    ~LifecycleScheduler();

    LifecycleScheduler(const LifecycleScheduler&) = delete;
    LifecycleScheduler& operator=(const LifecycleScheduler&) = delete;

    void set_on_expire(ExpireHandler handler) { m_on_expire = std::move(handler); }
    void set_on_tick(TickHandler handler) { m_on_tick = std::move(handler); }

    // ========================================================================
    // Arming / Cancelling
    // ========================================================================

    // Arms one entry per positive Duration and Tick field. Returns the
    // number of entries armed.
    size_t arm(const AuraInstance& aura);

    // Cancels every timer of the aura instance; returns how many were live
    size_t cancel(const core::UUID& aura_instance_id);

    void cancel_all();

    // ========================================================================
    // Queries
    // ========================================================================

    std::vector<LifecycleEntry> entries_for(const core::UUID& aura_instance_id) const;
    // nullopt once the entry reached a terminal state and was dropped
    std::optional<TimerState> state(uint64_t entry_id) const;

    size_t armed_count() const;
    size_t entry_count() const;

    float min_tick_interval() const { return m_min_tick_interval; }

private:
    uint64_t add_entry(ObjectHandle object, const core::UUID& aura_instance_id,
                       const std::string& effect_id, TimerKind kind, float seconds);
    void on_timer(uint64_t entry_id);
    void erase_entry(uint64_t entry_id);

    core::IScheduler& m_scheduler;
    float m_min_tick_interval;

    ExpireHandler m_on_expire;
    TickHandler m_on_tick;

    mutable std::mutex m_mutex;
    std::unordered_map<uint64_t, LifecycleEntry> m_entries;
    std::unordered_map<core::UUID, std::vector<uint64_t>> m_by_aura;
    uint64_t m_next_id = 1;
};

} // namespace auras::effects
