#include <auras/core/timer.hpp>
#include <algorithm>
#include <exception>
#include <utility>

namespace auras::core {

// ============================================================================
// TimerManager Implementation
// ============================================================================

TimerManager::TimerManager() = default;
TimerManager::~TimerManager() = default;

TimerHandle TimerManager::allocate_handle() {
    return TimerHandle{m_next_id++};
}

TimerManager::Timer* TimerManager::find_timer(TimerHandle handle) {
    for (auto& timer : m_timers) {
        if (timer.handle == handle && !timer.marked_for_removal) {
            return &timer;
        }
    }
    return nullptr;
}

const TimerManager::Timer* TimerManager::find_timer(TimerHandle handle) const {
    for (const auto& timer : m_timers) {
        if (timer.handle == handle && !timer.marked_for_removal) {
            return &timer;
        }
    }
    return nullptr;
}

bool TimerManager::was_cancelled(TimerHandle handle) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    for (const auto& timer : m_timers) {
        if (timer.handle == handle) {
            return timer.cancelled;
        }
    }
    // Entries collected by a running update are kept until every update
    // has finished, so an absent handle was never collected
    return false;
}

// ============================================================================
// Timer Creation
// ============================================================================

TimerHandle TimerManager::set_timeout(float delay, Callback callback) {
    TimerConfig config;
    config.delay = delay;
    config.repeat_count = 0;
    return create_timer(config, std::move(callback));
}

TimerHandle TimerManager::set_interval(float interval, Callback callback) {
    TimerConfig config;
    config.delay = interval;
    config.interval = interval;
    config.repeat_count = -1;
    return create_timer(config, std::move(callback));
}

TimerHandle TimerManager::set_interval(float interval, int count, Callback callback) {
    TimerConfig config;
    config.delay = interval;
    config.interval = interval;
    config.repeat_count = count;
    return create_timer(config, std::move(callback));
}

TimerHandle TimerManager::create_timer(const TimerConfig& config, Callback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);

    Timer timer;
    timer.handle = allocate_handle();
    timer.callback = std::move(callback);
    timer.remaining_time = config.delay;
    timer.interval = config.interval;
    timer.remaining_repeats = config.repeat_count;
    timer.paused = config.start_paused;
    timer.use_scaled_time = config.use_scaled_time;

    m_timers.push_back(std::move(timer));
    return m_timers.back().handle;
}

// ============================================================================
// Timer Control
// ============================================================================

void TimerManager::cancel(TimerHandle handle) {
    std::lock_guard<std::mutex> lock(m_mutex);

    // A one-shot that is mid-fire is already marked for removal, so search
    // every entry rather than using find_timer
    for (auto& timer : m_timers) {
        if (timer.handle == handle) {
            timer.cancelled = true;
            timer.marked_for_removal = true;
            return;
        }
    }
}

void TimerManager::pause(TimerHandle handle) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (auto* timer = find_timer(handle)) {
        timer->paused = true;
    }
}

void TimerManager::resume(TimerHandle handle) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (auto* timer = find_timer(handle)) {
        timer->paused = false;
    }
}

bool TimerManager::is_active(TimerHandle handle) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return find_timer(handle) != nullptr;
}

bool TimerManager::is_paused(TimerHandle handle) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (const auto* timer = find_timer(handle)) {
        return timer->paused;
    }
    return false;
}

float TimerManager::get_remaining(TimerHandle handle) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (const auto* timer = find_timer(handle)) {
        return timer->remaining_time;
    }
    return 0.0f;
}

void TimerManager::cancel_all() {
    std::lock_guard<std::mutex> lock(m_mutex);

    for (auto& timer : m_timers) {
        timer.cancelled = true;
        timer.marked_for_removal = true;
    }
}

size_t TimerManager::active_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    return static_cast<size_t>(std::count_if(m_timers.begin(), m_timers.end(),
        [](const Timer& t) { return !t.marked_for_removal; }));
}

// ============================================================================
// Update
// ============================================================================

void TimerManager::update(float dt, float time_scale) {
    // Copy callbacks so they can create or cancel timers while running
    struct DueCallback {
        TimerHandle handle;
        Callback callback;
        float overdue = 0.0f;   // How long before the end of this frame it fell due
    };
    std::vector<DueCallback> to_fire;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_updates_in_progress;

        for (auto& timer : m_timers) {
            if (timer.marked_for_removal || timer.paused) {
                continue;
            }

            float effective_dt = timer.use_scaled_time ? dt * time_scale : dt;
            timer.remaining_time -= effective_dt;

            if (timer.remaining_time > 0.0f) {
                continue;
            }

            to_fire.push_back({timer.handle, timer.callback, -timer.remaining_time});

            if (timer.remaining_repeats == 0 || timer.interval <= 0.0f) {
                timer.marked_for_removal = true;
                continue;
            }

            if (timer.remaining_repeats > 0 && --timer.remaining_repeats == 0) {
                timer.marked_for_removal = true;
                continue;
            }

            timer.remaining_time += timer.interval;

            // Overshoot: several intervals elapsed in one frame
            while (timer.remaining_time <= 0.0f) {
                to_fire.push_back({timer.handle, timer.callback, -timer.remaining_time});
                if (timer.remaining_repeats > 0 && --timer.remaining_repeats == 0) {
                    timer.marked_for_removal = true;
                    break;
                }
                timer.remaining_time += timer.interval;
            }
        }
    }

    // Deadline order; ties keep creation order
    std::stable_sort(to_fire.begin(), to_fire.end(),
        [](const DueCallback& a, const DueCallback& b) { return a.overdue > b.overdue; });

    // Fire outside the lock; skip anything an earlier callback cancelled.
    // A throwing callback does not stop the rest of the frame: the first
    // exception is rethrown once every due callback has run.
    std::exception_ptr first_error;
    for (const auto& due : to_fire) {
        if (!due.callback || was_cancelled(due.handle)) {
            continue;
        }
        try {
            due.callback();
        } catch (...) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }

    finish_update();

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

void TimerManager::finish_update() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (--m_updates_in_progress > 0) {
        return;
    }

    m_timers.erase(
        std::remove_if(m_timers.begin(), m_timers.end(),
            [](const Timer& t) { return t.marked_for_removal; }),
        m_timers.end()
    );
}

} // namespace auras::core
