#include <auras/core/settings.hpp>
#include <auras/core/filesystem.hpp>
#include <nlohmann/json.hpp>

namespace auras::core {

using json = nlohmann::json;

bool Settings::load(const std::string& path) {
    std::string content = FileSystem::read_text(path);
    if (content.empty()) {
        log(LogLevel::Error, "[Settings] Failed to read {}", path);
        return false;
    }

    return load_string(content);
}

bool Settings::load_string(const std::string& content) {
    // Parsed into a copy so a failure leaves every field untouched
    Settings parsed = *this;

    try {
        json j = json::parse(content);

        if (j.contains("log_level")) {
            auto name = j["log_level"].get<std::string>();
            if (auto level = parse_log_level(name)) {
                parsed.log_level = *level;
            } else {
                log(LogLevel::Warn, "[Settings] Unknown log_level '{}'", name);
            }
        }

        if (j.contains("aura_files") && j["aura_files"].is_array()) {
            parsed.aura_files.clear();
            for (const auto& file : j["aura_files"]) {
                if (file.is_string()) {
                    parsed.aura_files.push_back(file.get<std::string>());
                }
            }
        }

        if (j.contains("lifecycle")) {
            auto& l = j["lifecycle"];
            parsed.lifecycle.min_tick_interval = l.value("min_tick_interval", parsed.lifecycle.min_tick_interval);
        }

        if (j.contains("events")) {
            auto& e = j["events"];
            parsed.events.defer_events = e.value("defer_events", parsed.events.defer_events);
        }
    } catch (const json::exception& e) {
        log(LogLevel::Error, "[Settings] Parse error: {}", e.what());
        return false;
    }

    *this = std::move(parsed);
    return true;
}

bool Settings::save(const std::string& path) const {
    json j;

    j["log_level"] = log_level_name(log_level);
    j["aura_files"] = aura_files;

    j["lifecycle"] = {
        {"min_tick_interval", lifecycle.min_tick_interval}
    };

    j["events"] = {
        {"defer_events", events.defer_events}
    };

    return FileSystem::write_text(path, j.dump(4));
}

void Settings::apply() const {
    set_log_level(log_level);
}

void Settings::reset() {
    *this = Settings{};
}

} // namespace auras::core
