#include <auras/core/event_dispatcher.hpp>

namespace auras::core {

void EventDispatcher::flush() {
    // Swap out so handlers may queue follow-up events for the next flush
    std::vector<std::function<void()>> events_to_dispatch;
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        events_to_dispatch.swap(m_queued_events);
    }

    for (const auto& dispatch_fn : events_to_dispatch) {
        dispatch_fn();
    }
}

EventDispatcher& events() {
    static EventDispatcher instance;
    return instance;
}

} // namespace auras::core
