#pragma once

#include <auras/core/object_handle.hpp>
#include <auras/effects/effect_instance.hpp>
#include <auras/effects/value.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace auras::effects {

// ============================================================================
// Reducer - Folds one effect instance into the running aggregate
// ============================================================================

class Reducer {
public:
    virtual ~Reducer() = default;
    virtual Value reduce(const Value& accumulator, const EffectInstance& instance) const = 0;
};

// ============================================================================
// Applier - Pushes an aggregated value onto the host object
// ============================================================================

class Applier {
public:
    virtual ~Applier() = default;
    virtual void apply(ObjectHandle object, const Value& value) const = 0;
};

using ReduceFn = std::function<Value(const Value&, const EffectInstance&)>;
using ApplyFn = std::function<void(ObjectHandle, const Value&)>;

class FunctionReducer : public Reducer {
public:
    explicit FunctionReducer(ReduceFn fn) : m_fn(std::move(fn)) {}
    Value reduce(const Value& accumulator, const EffectInstance& instance) const override {
        return m_fn(accumulator, instance);
    }

private:
    ReduceFn m_fn;
};

class FunctionApplier : public Applier {
public:
    explicit FunctionApplier(ApplyFn fn) : m_fn(std::move(fn)) {}
    void apply(ObjectHandle object, const Value& value) const override {
        m_fn(object, value);
    }

private:
    ApplyFn m_fn;
};

inline std::shared_ptr<const Reducer> make_reducer(ReduceFn fn) {
    return std::make_shared<FunctionReducer>(std::move(fn));
}

inline std::shared_ptr<const Applier> make_applier(ApplyFn fn) {
    return std::make_shared<FunctionApplier>(std::move(fn));
}

// ============================================================================
// Stock Reducers
// ============================================================================

namespace reducers {

// One-or-more: true whenever at least one instance is active
std::shared_ptr<const Reducer> any();

// Numeric sum / max / min of a field (missing field counts as 0)
std::shared_ptr<const Reducer> sum(const std::string& field);
std::shared_ptr<const Reducer> max(const std::string& field);
std::shared_ptr<const Reducer> min(const std::string& field);

// Number of active instances
std::shared_ptr<const Reducer> count();

// Field of the most recently registered instance carrying it
std::shared_ptr<const Reducer> last(const std::string& field);

} // namespace reducers

// ============================================================================
// Effect Definition - Aggregation scheme for one kind of manipulation
// ============================================================================

struct EffectDefinition {
    std::string effect_id;
    Value default_value;                        // Fold seed; the value with no active instances
    std::shared_ptr<const Reducer> reducer;
    std::shared_ptr<const Applier> applier;     // Optional; query-only effects have none
};

// ============================================================================
// Effect Definition Registry
// ============================================================================

class EffectRegistry {
public:
    EffectRegistry() = default;

    EffectRegistry(const EffectRegistry&) = delete;
    EffectRegistry& operator=(const EffectRegistry&) = delete;

    // Throws DuplicateRegistrationError if the id is taken, AuraError if the
    // definition has no id or no reducer
    void register_effect(EffectDefinition def);

    // Throws UnknownEffectError; references stay valid for the registry's lifetime
    const EffectDefinition& get(const std::string& effect_id) const;

    const EffectDefinition* find(const std::string& effect_id) const;
    bool exists(const std::string& effect_id) const;

    // Sorted
    std::vector<std::string> get_all_effect_ids() const;
    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, EffectDefinition> m_effects;
};

// ============================================================================
// Effect Builder - Fluent API for creating definitions
// ============================================================================

class EffectBuilder {
public:
    EffectBuilder& id(const std::string& effect_id);
    EffectBuilder& default_value(Value value);
    EffectBuilder& reduce(std::shared_ptr<const Reducer> reducer);
    EffectBuilder& reduce(ReduceFn fn);
    EffectBuilder& apply(std::shared_ptr<const Applier> applier);
    EffectBuilder& apply(ApplyFn fn);

    EffectDefinition build() const;
    void register_effect(EffectRegistry& registry) const;

private:
    EffectDefinition m_def;
};

inline EffectBuilder effect() { return EffectBuilder{}; }

} // namespace auras::effects
