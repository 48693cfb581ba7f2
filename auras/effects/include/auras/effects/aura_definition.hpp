#pragma once

#include <auras/effects/value.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace auras::effects {

// ============================================================================
// AuraTemplate - Constructor output, before id and object are assigned
// ============================================================================

struct AuraTemplate {
    FieldMap shared_fields;     // Every field except the effect instances

    // Effect id -> instance-local fields, in application order
    std::vector<std::pair<std::string, FieldMap>> effect_instances;

    // Replaces the fields if the effect is already present
    AuraTemplate& add_effect(const std::string& effect_id, FieldMap fields = {});
    bool has_effect(const std::string& effect_id) const;
};

// ============================================================================
// AuraConstructor - settings -> AuraTemplate
// ============================================================================

class AuraConstructor {
public:
    virtual ~AuraConstructor() = default;

    // May throw; the aura system reports failures as InvalidSettingsError
    virtual AuraTemplate construct(const FieldMap& settings) const = 0;
};

using ConstructFn = std::function<AuraTemplate(const FieldMap&)>;

class FunctionAuraConstructor : public AuraConstructor {
public:
    explicit FunctionAuraConstructor(ConstructFn fn) : m_fn(std::move(fn)) {}
    AuraTemplate construct(const FieldMap& settings) const override { return m_fn(settings); }

private:
    ConstructFn m_fn;
};

// Fixed template; settings overwrite (or add) shared fields
class TemplateAuraConstructor : public AuraConstructor {
public:
    explicit TemplateAuraConstructor(AuraTemplate base) : m_base(std::move(base)) {}
    AuraTemplate construct(const FieldMap& settings) const override;

    const AuraTemplate& base() const { return m_base; }

private:
    AuraTemplate m_base;
};

// ============================================================================
// Aura Definition
// ============================================================================

struct AuraDefinition {
    std::string aura_id;
    std::shared_ptr<const AuraConstructor> constructor;
};

// ============================================================================
// Aura Definition Registry
// ============================================================================

class AuraRegistry {
public:
    AuraRegistry() = default;

    AuraRegistry(const AuraRegistry&) = delete;
    AuraRegistry& operator=(const AuraRegistry&) = delete;

    // Throws DuplicateRegistrationError if the id is taken. Effect ids used
    // by the constructor are resolved when the aura is applied.
    void register_aura(const std::string& aura_id, std::shared_ptr<const AuraConstructor> constructor);
    void register_aura(const std::string& aura_id, ConstructFn fn);

    // Data-driven definitions: { "auras": [ { "id", "shared", "effects": [ { "effect", "fields" } ] } ] }
    // Invalid or duplicate entries are logged and skipped; returns false if any were.
    bool load_auras(const std::string& path);
    bool load_auras_string(const std::string& content, const std::string& source = "<string>");

    // Throws UnknownAuraError
    const AuraDefinition& get(const std::string& aura_id) const;

    const AuraDefinition* find(const std::string& aura_id) const;
    bool exists(const std::string& aura_id) const;

    // Sorted
    std::vector<std::string> get_all_aura_ids() const;
    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, AuraDefinition> m_auras;
};

// ============================================================================
// Aura Builder - Fluent API for template-based auras
// ============================================================================

class AuraBuilder {
public:
    AuraBuilder& id(const std::string& aura_id);
    AuraBuilder& shared(const std::string& key, Value value);
    AuraBuilder& effect(const std::string& effect_id, FieldMap fields = {});

    AuraTemplate build() const;
    void register_aura(AuraRegistry& registry) const;

private:
    std::string m_id;
    AuraTemplate m_template;
};

inline AuraBuilder aura() { return AuraBuilder{}; }

} // namespace auras::effects
