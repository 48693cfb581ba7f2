#pragma once

#include <stdexcept>
#include <string>

namespace auras::effects {

// Base of every error raised by the aura core
class AuraError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Registry lookup of an id that was never registered
class NotFoundError : public AuraError {
public:
    NotFoundError(const std::string& kind, const std::string& id)
        : AuraError(kind + " '" + id + "' is not registered"), m_id(id) {}

    const std::string& id() const { return m_id; }

private:
    std::string m_id;
};

class UnknownAuraError : public NotFoundError {
public:
    explicit UnknownAuraError(const std::string& aura_id)
        : NotFoundError("Aura", aura_id) {}
};

// Also raised at application time when an aura template names an
// unregistered effect
class UnknownEffectError : public NotFoundError {
public:
    explicit UnknownEffectError(const std::string& effect_id)
        : NotFoundError("Effect", effect_id) {}
};

class DuplicateRegistrationError : public AuraError {
public:
    DuplicateRegistrationError(const std::string& kind, const std::string& id)
        : AuraError(kind + " '" + id + "' is already registered"), m_id(id) {}

    const std::string& id() const { return m_id; }

private:
    std::string m_id;
};

// Aura constructor rejected its settings, or a reserved field
// (Duration, Tick, Cleanup) has the wrong type
class InvalidSettingsError : public AuraError {
public:
    using AuraError::AuraError;
};

} // namespace auras::effects
