#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace auras::core {

// ============================================================================
// TimerHandle - Unique identifier for timer management
// ============================================================================

struct TimerHandle {
    uint64_t id = 0;

    bool valid() const { return id != 0; }
    explicit operator bool() const { return valid(); }

    bool operator==(const TimerHandle& other) const { return id == other.id; }
    bool operator!=(const TimerHandle& other) const { return id != other.id; }
};

// ============================================================================
// IScheduler - Clock capability consumed by the aura lifecycle
// ============================================================================

class IScheduler {
public:
    using Callback = std::function<void()>;

    virtual ~IScheduler() = default;

    // One-shot: callback runs once after delay seconds
    virtual TimerHandle set_timeout(float delay, Callback callback) = 0;

    // Repeating: callback runs every interval seconds until cancelled
    virtual TimerHandle set_interval(float interval, Callback callback) = 0;

    // After cancel returns the callback never runs again, even if it was
    // already due in the frame currently being processed
    virtual void cancel(TimerHandle handle) = 0;
};

// ============================================================================
// TimerConfig - Configuration for timer creation
// ============================================================================

struct TimerConfig {
    float delay = 0.0f;             // Initial delay before first execution
    float interval = 0.0f;          // Repeat interval (0 = one-shot after delay)
    int repeat_count = 0;           // 0 = one-shot, -1 = infinite, N = repeat N times
    bool use_scaled_time = true;    // Respects time scale (pausing/slowmo)
    bool start_paused = false;
};

// ============================================================================
// TimerManager - Frame-driven scheduler
// ============================================================================

class TimerManager : public IScheduler {
public:
    TimerManager();
    ~TimerManager() override;

    TimerManager(const TimerManager&) = delete;
    TimerManager& operator=(const TimerManager&) = delete;
    TimerManager(TimerManager&&) = delete;
    TimerManager& operator=(TimerManager&&) = delete;

    // ========================================================================
    // Timer Creation
    // ========================================================================

    TimerHandle set_timeout(float delay, Callback callback) override;
    TimerHandle set_interval(float interval, Callback callback) override;

    // Repeating timer with count - executes N times
    TimerHandle set_interval(float interval, int count, Callback callback);

    TimerHandle create_timer(const TimerConfig& config, Callback callback);

    // ========================================================================
    // Timer Control
    // ========================================================================

    void cancel(TimerHandle handle) override;
    void pause(TimerHandle handle);
    void resume(TimerHandle handle);

    // Not cancelled and not yet finished (may be paused)
    bool is_active(TimerHandle handle) const;
    bool is_paused(TimerHandle handle) const;

    // Time until next execution
    float get_remaining(TimerHandle handle) const;

    void cancel_all();

    size_t active_count() const;

    // ========================================================================
    // Update
    // ========================================================================

    // Advance all timers and run due callbacks - call once per frame.
    // Callbacks run on the calling thread, outside the internal lock, in
    // the order they fell due. If callbacks throw, the rest still run and
    // the first exception is rethrown afterwards.
    void update(float dt, float time_scale = 1.0f);

private:
    struct Timer {
        TimerHandle handle;
        Callback callback;
        float remaining_time = 0.0f;
        float interval = 0.0f;
        int remaining_repeats = 0;  // -1 = infinite
        bool paused = false;
        bool use_scaled_time = true;
        bool cancelled = false;
        bool marked_for_removal = false;
    };

    TimerHandle allocate_handle();
    Timer* find_timer(TimerHandle handle);
    const Timer* find_timer(TimerHandle handle) const;
    bool was_cancelled(TimerHandle handle) const;

    // Finished timers are erased once no update is firing callbacks
    void finish_update();

    mutable std::mutex m_mutex;
    std::vector<Timer> m_timers;
    uint64_t m_next_id = 1;
    int m_updates_in_progress = 0;
};

} // namespace auras::core
