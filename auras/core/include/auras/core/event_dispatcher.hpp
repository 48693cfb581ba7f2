#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace auras::core {

// ============================================================================
// ScopedConnection - RAII handle for event subscriptions
// ============================================================================

class ScopedConnection {
public:
    ScopedConnection() = default;

    explicit ScopedConnection(std::function<void()> disconnect_fn)
        : m_disconnect(std::move(disconnect_fn)) {}

    ~ScopedConnection() {
        disconnect();
    }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    ScopedConnection(ScopedConnection&& other) noexcept
        : m_disconnect(std::move(other.m_disconnect)) {
        other.m_disconnect = nullptr;
    }

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            disconnect();
            m_disconnect = std::move(other.m_disconnect);
            other.m_disconnect = nullptr;
        }
        return *this;
    }

    void disconnect() {
        if (m_disconnect) {
            m_disconnect();
            m_disconnect = nullptr;
        }
    }

    bool connected() const {
        return m_disconnect != nullptr;
    }

private:
    std::function<void()> m_disconnect;
};

// ============================================================================
// EventDispatcher - Type-safe event pub/sub
// ============================================================================

class EventDispatcher {
public:
    EventDispatcher() = default;
    ~EventDispatcher() = default;

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;
    EventDispatcher(EventDispatcher&&) = delete;
    EventDispatcher& operator=(EventDispatcher&&) = delete;

    // Returns a ScopedConnection that auto-unsubscribes on destruction
    template<typename T>
    ScopedConnection subscribe(std::function<void(const T&)> callback) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");

        auto type_idx = std::type_index(typeid(T));
        uint64_t handler_id = m_next_handler_id++;

        auto wrapper = [callback = std::move(callback)](const void* event) {
            callback(*static_cast<const T*>(event));
        };

        {
            std::lock_guard<std::mutex> lock(m_handlers_mutex);
            m_handlers[type_idx].push_back({handler_id, std::move(wrapper)});
        }

        return ScopedConnection([this, type_idx, handler_id]() {
            std::lock_guard<std::mutex> lock(m_handlers_mutex);
            auto it = m_handlers.find(type_idx);
            if (it != m_handlers.end()) {
                auto& handlers = it->second;
                handlers.erase(
                    std::remove_if(handlers.begin(), handlers.end(),
                        [handler_id](const Handler& h) { return h.id == handler_id; }),
                    handlers.end()
                );
            }
        });
    }

    // Calls all handlers synchronously in order of subscription.
    // Handlers may subscribe or dispatch re-entrantly.
    template<typename T>
    void dispatch(const T& event) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");

        std::vector<Handler> handlers_copy;
        {
            std::lock_guard<std::mutex> lock(m_handlers_mutex);
            auto it = m_handlers.find(std::type_index(typeid(T)));
            if (it != m_handlers.end()) {
                handlers_copy = it->second;
            }
        }

        for (const auto& handler : handlers_copy) {
            handler.callback(&event);
        }
    }

    // Thread-safe: events are dispatched when flush() is called
    template<typename T>
    void queue(T event) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");

        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_queued_events.push_back([this, event = std::move(event)]() {
            dispatch(event);
        });
    }

    void flush();

    size_t queued_event_count() const {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        return m_queued_events.size();
    }

    template<typename T>
    size_t handler_count() const {
        std::lock_guard<std::mutex> lock(m_handlers_mutex);
        auto it = m_handlers.find(std::type_index(typeid(T)));
        return it != m_handlers.end() ? it->second.size() : 0;
    }

private:
    struct Handler {
        uint64_t id;
        std::function<void(const void*)> callback;
    };

    mutable std::mutex m_handlers_mutex;
    std::unordered_map<std::type_index, std::vector<Handler>> m_handlers;

    mutable std::mutex m_queue_mutex;
    std::vector<std::function<void()>> m_queued_events;

    std::atomic<uint64_t> m_next_handler_id{1};
};

// Process-wide dispatcher used when a system is not given its own
EventDispatcher& events();

} // namespace auras::core
