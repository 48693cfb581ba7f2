#include <auras/effects/aura_definition.hpp>
#include <auras/effects/errors.hpp>
#include <auras/data/json_loader.hpp>
#include <auras/core/log.hpp>
#include <algorithm>
#include <optional>

namespace auras::effects {

namespace {

using json = nlohmann::json;

std::optional<Value> value_from_json(const json& j, std::string& out_error);

std::optional<FieldMap> fields_from_json(const json& j, std::string& out_error) {
    FieldMap map;
    for (auto it = j.begin(); it != j.end(); ++it) {
        auto value = value_from_json(it.value(), out_error);
        if (!value) {
            out_error = "'" + it.key() + "': " + out_error;
            return std::nullopt;
        }
        map.set(it.key(), std::move(*value));
    }
    return map;
}

std::optional<Value> value_from_json(const json& j, std::string& out_error) {
    switch (j.type()) {
        case json::value_t::null:
            return Value();
        case json::value_t::boolean:
            return Value(j.get<bool>());
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return Value(j.get<int64_t>());
        case json::value_t::number_float:
            return Value(j.get<double>());
        case json::value_t::string:
            return Value(j.get<std::string>());
        case json::value_t::object: {
            auto map = fields_from_json(j, out_error);
            if (!map) return std::nullopt;
            return Value(std::move(*map));
        }
        default:
            out_error = std::string("unsupported JSON type ") + j.type_name();
            return std::nullopt;
    }
}

struct AuraSpec {
    std::string id;
    AuraTemplate base;
};

std::optional<AuraSpec> deserialize_aura(const json& j, std::string& out_error) {
    using namespace data::json_helpers;

    if (!require_string(j, "id", out_error)) return std::nullopt;
    if (!optional_object(j, "shared", out_error)) return std::nullopt;
    if (!require_array(j, "effects", out_error)) return std::nullopt;

    AuraSpec spec;
    spec.id = j["id"].get<std::string>();

    if (j.contains("shared")) {
        auto shared = fields_from_json(j["shared"], out_error);
        if (!shared) {
            out_error = "aura '" + spec.id + "' shared " + out_error;
            return std::nullopt;
        }
        spec.base.shared_fields = std::move(*shared);
    }

    for (const auto& entry : j["effects"]) {
        if (!entry.is_object()) {
            out_error = "aura '" + spec.id + "' has a non-object effect entry";
            return std::nullopt;
        }
        if (!require_string(entry, "effect", out_error) ||
            !optional_object(entry, "fields", out_error)) {
            out_error = "aura '" + spec.id + "': " + out_error;
            return std::nullopt;
        }

        std::string effect_id = entry["effect"].get<std::string>();
        if (spec.base.has_effect(effect_id)) {
            out_error = "aura '" + spec.id + "' lists effect '" + effect_id + "' twice";
            return std::nullopt;
        }

        FieldMap fields;
        if (entry.contains("fields")) {
            auto parsed = fields_from_json(entry["fields"], out_error);
            if (!parsed) {
                out_error = "aura '" + spec.id + "' effect '" + effect_id + "' " + out_error;
                return std::nullopt;
            }
            fields = std::move(*parsed);
        }
        spec.base.add_effect(effect_id, std::move(fields));
    }

    if (spec.base.effect_instances.empty()) {
        out_error = "aura '" + spec.id + "' has no effects";
        return std::nullopt;
    }

    return spec;
}

bool register_loaded(AuraRegistry& registry, data::LoadResult<AuraSpec>& result,
                     const std::string& source) {
    for (const auto& warn : result.warnings) {
        core::log(core::LogLevel::Warn, "[AuraLoader] {}", warn);
    }

    for (const auto& err : result.errors) {
        core::log(core::LogLevel::Error, "[AuraLoader] {}", err);
    }

    size_t registered = 0;
    bool ok = result.success();

    for (auto& spec : result.items) {
        try {
            registry.register_aura(spec.id,
                std::make_shared<TemplateAuraConstructor>(std::move(spec.base)));
            ++registered;
        } catch (const DuplicateRegistrationError& e) {
            core::log(core::LogLevel::Error, "[AuraLoader] {}", e.what());
            ok = false;
        }
    }

    core::log(core::LogLevel::Info, "[AuraLoader] Loaded {} auras from {} ({} errors)",
              registered, source, result.error_count());
    return ok;
}

} // anonymous namespace

// ============================================================================
// AuraTemplate Implementation
// ============================================================================

AuraTemplate& AuraTemplate::add_effect(const std::string& effect_id, FieldMap fields) {
    for (auto& [id, existing] : effect_instances) {
        if (id == effect_id) {
            existing = std::move(fields);
            return *this;
        }
    }
    effect_instances.emplace_back(effect_id, std::move(fields));
    return *this;
}

bool AuraTemplate::has_effect(const std::string& effect_id) const {
    return std::any_of(effect_instances.begin(), effect_instances.end(),
        [&effect_id](const auto& entry) { return entry.first == effect_id; });
}

AuraTemplate TemplateAuraConstructor::construct(const FieldMap& settings) const {
    AuraTemplate result = m_base;
    result.shared_fields.merge_overwrite(settings);
    return result;
}

// ============================================================================
// AuraRegistry Implementation
// ============================================================================

void AuraRegistry::register_aura(const std::string& aura_id,
                                 std::shared_ptr<const AuraConstructor> constructor) {
    if (aura_id.empty()) {
        throw AuraError("Aura definition has no id");
    }
    if (!constructor) {
        throw AuraError("Aura '" + aura_id + "' has no constructor");
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_auras.find(aura_id) != m_auras.end()) {
        throw DuplicateRegistrationError("Aura", aura_id);
    }

    m_auras.emplace(aura_id, AuraDefinition{aura_id, std::move(constructor)});
    core::log(core::LogLevel::Debug, "[Auras] Registered aura '{}'", aura_id);
}

void AuraRegistry::register_aura(const std::string& aura_id, ConstructFn fn) {
    register_aura(aura_id, std::make_shared<FunctionAuraConstructor>(std::move(fn)));
}

bool AuraRegistry::load_auras(const std::string& path) {
    core::log(core::LogLevel::Info, "[AuraLoader] Loading auras from: {}", path);

    auto result = data::load_json_array<AuraSpec>(path, deserialize_aura, "auras");
    return register_loaded(*this, result, path);
}

bool AuraRegistry::load_auras_string(const std::string& content, const std::string& source) {
    data::LoadResult<AuraSpec> result;
    try {
        result = data::parse_json_array<AuraSpec>(json::parse(content), deserialize_aura, "auras");
    } catch (const json::parse_error& e) {
        result.errors.push_back("Parse error in " + source + ": " + e.what());
    }
    return register_loaded(*this, result, source);
}

const AuraDefinition& AuraRegistry::get(const std::string& aura_id) const {
    const AuraDefinition* def = find(aura_id);
    if (!def) {
        throw UnknownAuraError(aura_id);
    }
    return *def;
}

const AuraDefinition* AuraRegistry::find(const std::string& aura_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_auras.find(aura_id);
    return it != m_auras.end() ? &it->second : nullptr;
}

bool AuraRegistry::exists(const std::string& aura_id) const {
    return find(aura_id) != nullptr;
}

std::vector<std::string> AuraRegistry::get_all_aura_ids() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<std::string> result;
    result.reserve(m_auras.size());
    for (const auto& [id, def] : m_auras) {
        result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t AuraRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_auras.size();
}

// ============================================================================
// AuraBuilder Implementation
// ============================================================================

AuraBuilder& AuraBuilder::id(const std::string& aura_id) {
    m_id = aura_id;
    return *this;
}

AuraBuilder& AuraBuilder::shared(const std::string& key, Value value) {
    m_template.shared_fields.set(key, std::move(value));
    return *this;
}

AuraBuilder& AuraBuilder::effect(const std::string& effect_id, FieldMap fields) {
    m_template.add_effect(effect_id, std::move(fields));
    return *this;
}

AuraTemplate AuraBuilder::build() const {
    return m_template;
}

void AuraBuilder::register_aura(AuraRegistry& registry) const {
    registry.register_aura(m_id, std::make_shared<TemplateAuraConstructor>(m_template));
}

} // namespace auras::effects
