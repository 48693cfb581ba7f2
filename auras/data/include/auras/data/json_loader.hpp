#pragma once

#include <auras/core/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace auras::data {

// ============================================================================
// LoadResult - Result of a JSON loading operation
// ============================================================================

template<typename T>
struct LoadResult {
    std::vector<T> items;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    size_t total_processed = 0;

    bool success() const { return errors.empty(); }
    size_t loaded_count() const { return items.size(); }
    size_t error_count() const { return errors.size(); }
};

// ============================================================================
// JSON Loading Utilities
// ============================================================================

// Returns nullopt if the file cannot be opened or parsed
inline std::optional<nlohmann::json> load_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        core::log(core::LogLevel::Error, "[JsonLoader] Failed to open file: {}", path);
        return std::nullopt;
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        core::log(core::LogLevel::Error, "[JsonLoader] Parse error in {}: {}", path, e.what());
        return std::nullopt;
    }
}

// ============================================================================
// parse_json_array - Deserialize every object of an array
// ============================================================================

// Deserializer signature:
// std::optional<T> deserialize(const nlohmann::json& obj, std::string& out_error)

template<typename T, typename Deserializer>
LoadResult<T> parse_json_array(
    const nlohmann::json& root,
    Deserializer deserialize_fn,
    const std::string& array_key = ""  // Empty = root is array, otherwise look for this key
) {
    LoadResult<T> result;

    const nlohmann::json* arr = nullptr;
    if (array_key.empty()) {
        if (!root.is_array()) {
            result.errors.push_back("Expected root to be an array");
            return result;
        }
        arr = &root;
    } else {
        if (!root.is_object() || !root.contains(array_key)) {
            result.errors.push_back("Missing key '" + array_key + "' in JSON");
            return result;
        }
        if (!root[array_key].is_array()) {
            result.errors.push_back("Key '" + array_key + "' is not an array");
            return result;
        }
        arr = &root[array_key];
    }

    result.items.reserve(arr->size());
    size_t index = 0;

    for (const auto& item : *arr) {
        ++result.total_processed;

        if (!item.is_object()) {
            result.warnings.push_back("Item at index " + std::to_string(index) + " is not an object, skipping");
            ++index;
            continue;
        }

        std::string error;
        auto obj_opt = deserialize_fn(item, error);

        if (obj_opt) {
            result.items.push_back(std::move(*obj_opt));
        } else {
            result.errors.push_back("Item " + std::to_string(index) + ": " + error);
        }

        ++index;
    }

    return result;
}

// Same as parse_json_array, reading the document from a file
template<typename T, typename Deserializer>
LoadResult<T> load_json_array(
    const std::string& path,
    Deserializer deserialize_fn,
    const std::string& array_key = ""
) {
    auto json_opt = load_json_file(path);
    if (!json_opt) {
        LoadResult<T> result;
        result.errors.push_back("Failed to load or parse file: " + path);
        return result;
    }

    return parse_json_array<T>(*json_opt, std::move(deserialize_fn), array_key);
}

// ============================================================================
// JSON Value Helpers
// ============================================================================

namespace json_helpers {

inline bool require_string(const nlohmann::json& j, const std::string& key, std::string& out_error) {
    if (!j.contains(key)) {
        out_error = "Missing required field '" + key + "'";
        return false;
    }
    if (!j[key].is_string() || j[key].get<std::string>().empty()) {
        out_error = "Field '" + key + "' must be a non-empty string";
        return false;
    }
    return true;
}

inline bool require_array(const nlohmann::json& j, const std::string& key, std::string& out_error) {
    if (!j.contains(key)) {
        out_error = "Missing required field '" + key + "'";
        return false;
    }
    if (!j[key].is_array()) {
        out_error = "Field '" + key + "' must be an array";
        return false;
    }
    return true;
}

// Absent is fine; present must be an object
inline bool optional_object(const nlohmann::json& j, const std::string& key, std::string& out_error) {
    if (j.contains(key) && !j[key].is_object()) {
        out_error = "Field '" + key + "' must be an object";
        return false;
    }
    return true;
}

} // namespace json_helpers

} // namespace auras::data
