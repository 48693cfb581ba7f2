#pragma once

#include <auras/core/log.hpp>
#include <string>
#include <vector>

namespace auras::core {

struct LifecycleSettings {
    float min_tick_interval = 0.01f;   // Shorter Tick fields are clamped up to this
};

struct EventSettings {
    bool defer_events = false;         // Queue events for EventDispatcher::flush() instead of dispatching inline
};

struct Settings {
    LogLevel log_level = LogLevel::Info;
    std::vector<std::string> aura_files;   // JSON aura definition files to load at startup

    LifecycleSettings lifecycle;
    EventSettings events;

    // Load settings from JSON file; missing keys keep their current value
    bool load(const std::string& path);

    // Parse settings from a JSON document; on failure nothing changes
    bool load_string(const std::string& content);

    bool save(const std::string& path) const;

    // Applies log_level to the global logger
    void apply() const;

    void reset();
};

} // namespace auras::core
