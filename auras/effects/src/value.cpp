#include <auras/effects/value.hpp>
#include <algorithm>
#include <format>
#include <stdexcept>

namespace auras::effects {

// ============================================================================
// Value Implementation
// ============================================================================

bool Value::as_bool() const {
    if (m_type != Type::Bool) throw std::runtime_error("Value is not a bool");
    return std::get<bool>(m_value);
}

int64_t Value::as_int() const {
    if (m_type != Type::Int) throw std::runtime_error("Value is not an int");
    return std::get<int64_t>(m_value);
}

double Value::as_float() const {
    if (m_type == Type::Float) return std::get<double>(m_value);
    if (m_type == Type::Int) return static_cast<double>(std::get<int64_t>(m_value));
    throw std::runtime_error("Value is not numeric");
}

const std::string& Value::as_string() const {
    if (m_type != Type::String) throw std::runtime_error("Value is not a string");
    return std::get<std::string>(m_value);
}

const FieldMap& Value::as_map() const {
    if (m_type != Type::Map) throw std::runtime_error("Value is not a map");
    return *std::get<std::shared_ptr<const FieldMap>>(m_value);
}

std::string Value::to_string() const {
    switch (m_type) {
        case Type::Null:
            return "null";
        case Type::Bool:
            return std::get<bool>(m_value) ? "true" : "false";
        case Type::Int:
            return std::to_string(std::get<int64_t>(m_value));
        case Type::Float:
            return std::format("{}", std::get<double>(m_value));
        case Type::String:
            return "\"" + std::get<std::string>(m_value) + "\"";
        case Type::Map: {
            std::string result = "{";
            bool first = true;
            for (const auto& [key, value] : as_map()) {
                if (!first) result += ", ";
                result += key + ": " + value.to_string();
                first = false;
            }
            return result + "}";
        }
    }
    return "null";
}

bool Value::operator==(const Value& other) const {
    if (m_type != other.m_type) return false;

    if (m_type == Type::Map) {
        return as_map() == other.as_map();
    }
    return m_value == other.m_value;
}

const char* Value::type_name(Type type) {
    switch (type) {
        case Type::Null:   return "null";
        case Type::Bool:   return "bool";
        case Type::Int:    return "int";
        case Type::Float:  return "float";
        case Type::String: return "string";
        case Type::Map:    return "map";
    }
    return "unknown";
}

// ============================================================================
// FieldMap Implementation
// ============================================================================

FieldMap::FieldMap(std::initializer_list<Entry> entries) {
    for (const auto& [key, value] : entries) {
        set(key, value);
    }
}

void FieldMap::set(const std::string& key, Value value) {
    for (auto& entry : m_entries) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    m_entries.emplace_back(key, std::move(value));
}

bool FieldMap::erase(const std::string& key) {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
        [&key](const Entry& e) { return e.first == key; });
    if (it == m_entries.end()) return false;
    m_entries.erase(it);
    return true;
}

const Value* FieldMap::find(const std::string& key) const {
    for (const auto& entry : m_entries) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

const Value& FieldMap::get(const std::string& key) const {
    static const Value s_null;
    const Value* value = find(key);
    return value ? *value : s_null;
}

bool FieldMap::get_bool(const std::string& key, bool def) const {
    const Value* value = find(key);
    return value ? value->get_bool(def) : def;
}

double FieldMap::get_float(const std::string& key, double def) const {
    const Value* value = find(key);
    return value ? value->get_float(def) : def;
}

std::string FieldMap::get_string(const std::string& key, const std::string& def) const {
    const Value* value = find(key);
    return value ? value->get_string(def) : def;
}

void FieldMap::merge_missing(const FieldMap& other) {
    for (const auto& [key, value] : other.m_entries) {
        if (!contains(key)) {
            m_entries.emplace_back(key, value);
        }
    }
}

void FieldMap::merge_overwrite(const FieldMap& other) {
    for (const auto& [key, value] : other.m_entries) {
        set(key, value);
    }
}

} // namespace auras::effects
