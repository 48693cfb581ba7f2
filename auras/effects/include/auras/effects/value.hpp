#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace auras::effects {

class FieldMap;

// ============================================================================
// Value - Variant type for effect instance fields and aggregated results
// ============================================================================

class Value {
public:
    enum class Type {
        Null,
        Bool,
        Int,
        Float,
        String,
        Map
    };

    Value() : m_type(Type::Null) {}
    explicit Value(bool v) : m_type(Type::Bool), m_value(v) {}
    explicit Value(int64_t v) : m_type(Type::Int), m_value(v) {}
    explicit Value(int v) : m_type(Type::Int), m_value(static_cast<int64_t>(v)) {}
    explicit Value(double v) : m_type(Type::Float), m_value(v) {}
    explicit Value(float v) : m_type(Type::Float), m_value(static_cast<double>(v)) {}
    explicit Value(const std::string& v) : m_type(Type::String), m_value(v) {}
    explicit Value(std::string&& v) : m_type(Type::String), m_value(std::move(v)) {}
    explicit Value(const char* v) : m_type(Type::String), m_value(std::string(v)) {}
    explicit Value(FieldMap map);

    Type type() const { return m_type; }
    bool is_null() const { return m_type == Type::Null; }
    bool is_bool() const { return m_type == Type::Bool; }
    bool is_int() const { return m_type == Type::Int; }
    bool is_float() const { return m_type == Type::Float; }
    bool is_string() const { return m_type == Type::String; }
    bool is_map() const { return m_type == Type::Map; }
    bool is_numeric() const { return m_type == Type::Int || m_type == Type::Float; }

    // Type-checked getters (throw std::runtime_error on type mismatch)
    bool as_bool() const;
    int64_t as_int() const;
    double as_float() const;    // Accepts Int as well
    const std::string& as_string() const;
    const FieldMap& as_map() const;

    // Safe getters with defaults
    bool get_bool(bool def = false) const {
        return m_type == Type::Bool ? std::get<bool>(m_value) : def;
    }

    int64_t get_int(int64_t def = 0) const {
        return m_type == Type::Int ? std::get<int64_t>(m_value) : def;
    }

    double get_float(double def = 0.0) const {
        if (m_type == Type::Float) return std::get<double>(m_value);
        if (m_type == Type::Int) return static_cast<double>(std::get<int64_t>(m_value));
        return def;
    }

    std::string get_string(const std::string& def = "") const {
        return m_type == Type::String ? std::get<std::string>(m_value) : def;
    }

    // Debug representation ("null", "true", "1.5", "\"text\"", "{a: 1}")
    std::string to_string() const;

    // Deep comparison; Int and Float never compare equal to each other
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    static const char* type_name(Type type);

private:
    Type m_type;
    // Nested maps are immutable once wrapped, so copies share them
    std::variant<std::monostate, bool, int64_t, double, std::string,
                 std::shared_ptr<const FieldMap>> m_value;
};

// ============================================================================
// FieldMap - Insertion-ordered string -> Value mapping
// ============================================================================

class FieldMap {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    FieldMap() = default;
    FieldMap(std::initializer_list<Entry> entries);

    // Replaces in place when the key exists, appends otherwise
    void set(const std::string& key, Value value);

    // Returns false if the key was absent
    bool erase(const std::string& key);

    const Value* find(const std::string& key) const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }

    // Null value when absent
    const Value& get(const std::string& key) const;

    bool get_bool(const std::string& key, bool def = false) const;
    double get_float(const std::string& key, double def = 0.0) const;
    std::string get_string(const std::string& key, const std::string& def = "") const;

    // Adds every entry of `other` whose key is not already present.
    // Existing entries keep their value and position.
    void merge_missing(const FieldMap& other);

    // Sets every entry of `other`, overwriting existing keys
    void merge_overwrite(const FieldMap& other);

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }

    // Order-sensitive comparison
    bool operator==(const FieldMap& other) const { return m_entries == other.m_entries; }
    bool operator!=(const FieldMap& other) const { return !(*this == other); }

private:
    std::vector<Entry> m_entries;
};

inline Value::Value(FieldMap map)
    : m_type(Type::Map), m_value(std::make_shared<const FieldMap>(std::move(map))) {}

} // namespace auras::effects
