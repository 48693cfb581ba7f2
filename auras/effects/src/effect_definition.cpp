#include <auras/effects/effect_definition.hpp>
#include <auras/effects/errors.hpp>
#include <auras/core/log.hpp>
#include <algorithm>

namespace auras::effects {

// ============================================================================
// Stock Reducers
// ============================================================================

namespace reducers {

namespace {

class AnyReducer : public Reducer {
public:
    Value reduce(const Value&, const EffectInstance&) const override {
        return Value(true);
    }
};

class FieldReducer : public Reducer {
public:
    enum class Mode { Sum, Max, Min };

    FieldReducer(std::string field, Mode mode) : m_field(std::move(field)), m_mode(mode) {}

    Value reduce(const Value& accumulator, const EffectInstance& instance) const override {
        double contribution = instance.get_float(m_field);

        // A non-numeric seed (e.g. null default) starts the fold at this instance
        if (!accumulator.is_numeric()) {
            return Value(contribution);
        }

        double acc = accumulator.as_float();
        switch (m_mode) {
            case Mode::Sum: return Value(acc + contribution);
            case Mode::Max: return Value(std::max(acc, contribution));
            case Mode::Min: return Value(std::min(acc, contribution));
        }
        return accumulator;
    }

private:
    std::string m_field;
    Mode m_mode;
};

class CountReducer : public Reducer {
public:
    Value reduce(const Value& accumulator, const EffectInstance&) const override {
        return Value(accumulator.get_int(0) + 1);
    }
};

class LastReducer : public Reducer {
public:
    explicit LastReducer(std::string field) : m_field(std::move(field)) {}

    Value reduce(const Value& accumulator, const EffectInstance& instance) const override {
        const Value* value = instance.fields.find(m_field);
        return value ? *value : accumulator;
    }

private:
    std::string m_field;
};

} // anonymous namespace

std::shared_ptr<const Reducer> any() {
    return std::make_shared<AnyReducer>();
}

std::shared_ptr<const Reducer> sum(const std::string& field) {
    return std::make_shared<FieldReducer>(field, FieldReducer::Mode::Sum);
}

std::shared_ptr<const Reducer> max(const std::string& field) {
    return std::make_shared<FieldReducer>(field, FieldReducer::Mode::Max);
}

std::shared_ptr<const Reducer> min(const std::string& field) {
    return std::make_shared<FieldReducer>(field, FieldReducer::Mode::Min);
}

std::shared_ptr<const Reducer> count() {
    return std::make_shared<CountReducer>();
}

std::shared_ptr<const Reducer> last(const std::string& field) {
    return std::make_shared<LastReducer>(field);
}

} // namespace reducers

// ============================================================================
// EffectRegistry Implementation
// ============================================================================

void EffectRegistry::register_effect(EffectDefinition def) {
    if (def.effect_id.empty()) {
        throw AuraError("Effect definition has no id");
    }
    if (!def.reducer) {
        throw AuraError("Effect '" + def.effect_id + "' has no reducer");
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_effects.find(def.effect_id) != m_effects.end()) {
        throw DuplicateRegistrationError("Effect", def.effect_id);
    }

    core::log(core::LogLevel::Debug, "[Auras] Registered effect '{}' (default {})",
              def.effect_id, def.default_value.to_string());

    std::string id = def.effect_id;
    m_effects.emplace(std::move(id), std::move(def));
}

const EffectDefinition& EffectRegistry::get(const std::string& effect_id) const {
    const EffectDefinition* def = find(effect_id);
    if (!def) {
        throw UnknownEffectError(effect_id);
    }
    return *def;
}

const EffectDefinition* EffectRegistry::find(const std::string& effect_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_effects.find(effect_id);
    return it != m_effects.end() ? &it->second : nullptr;
}

bool EffectRegistry::exists(const std::string& effect_id) const {
    return find(effect_id) != nullptr;
}

std::vector<std::string> EffectRegistry::get_all_effect_ids() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<std::string> result;
    result.reserve(m_effects.size());
    for (const auto& [id, def] : m_effects) {
        result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t EffectRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_effects.size();
}

// ============================================================================
// EffectBuilder Implementation
// ============================================================================

EffectBuilder& EffectBuilder::id(const std::string& effect_id) {
    m_def.effect_id = effect_id;
    return *this;
}

EffectBuilder& EffectBuilder::default_value(Value value) {
    m_def.default_value = std::move(value);
    return *this;
}

EffectBuilder& EffectBuilder::reduce(std::shared_ptr<const Reducer> reducer) {
    m_def.reducer = std::move(reducer);
    return *this;
}

EffectBuilder& EffectBuilder::reduce(ReduceFn fn) {
    m_def.reducer = make_reducer(std::move(fn));
    return *this;
}

EffectBuilder& EffectBuilder::apply(std::shared_ptr<const Applier> applier) {
    m_def.applier = std::move(applier);
    return *this;
}

EffectBuilder& EffectBuilder::apply(ApplyFn fn) {
    m_def.applier = make_applier(std::move(fn));
    return *this;
}

EffectDefinition EffectBuilder::build() const {
    return m_def;
}

void EffectBuilder::register_effect(EffectRegistry& registry) const {
    registry.register_effect(build());
}

} // namespace auras::effects
