#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace auras::core {

/**
 * @brief 128-bit Universally Unique Identifier (RFC 4122 Version 4)
 *
 * Identifies aura instances. Generated ids are random, so an id that has
 * been removed from an object is never handed out again.
 *
 * @code
 * auto id = UUID::generate();
 * std::string str = id.to_string();  // "550e8400-e29b-41d4-a716-446655440000"
 * auto parsed = UUID::from_string(str);
 * @endcode
 */
class UUID {
public:
    static constexpr size_t STRING_SIZE = 36;  // "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"

    /// Default constructor creates a null UUID (all zeros)
    constexpr UUID() noexcept = default;

    /// Generate a new random UUID (thread-safe)
    [[nodiscard]] static UUID generate();

    /// Parse "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" or the 32-digit form without hyphens
    [[nodiscard]] static std::optional<UUID> from_string(std::string_view str);

    /// Create UUID from two 64-bit values (high, low)
    [[nodiscard]] static constexpr UUID from_u64(uint64_t high, uint64_t low) noexcept {
        UUID uuid;
        uuid.m_high = high;
        uuid.m_low = low;
        return uuid;
    }

    [[nodiscard]] static constexpr UUID null() noexcept { return UUID{}; }

    [[nodiscard]] constexpr bool is_null() const noexcept { return m_high == 0 && m_low == 0; }
    [[nodiscard]] constexpr explicit operator bool() const noexcept { return !is_null(); }

    [[nodiscard]] constexpr uint64_t high() const noexcept { return m_high; }
    [[nodiscard]] constexpr uint64_t low() const noexcept { return m_low; }

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] size_t hash() const noexcept;

    [[nodiscard]] constexpr bool operator==(const UUID& other) const noexcept {
        return m_high == other.m_high && m_low == other.m_low;
    }
    [[nodiscard]] constexpr bool operator!=(const UUID& other) const noexcept {
        return !(*this == other);
    }
    [[nodiscard]] constexpr bool operator<(const UUID& other) const noexcept {
        return m_high != other.m_high ? m_high < other.m_high : m_low < other.m_low;
    }

private:
    uint64_t m_high = 0;
    uint64_t m_low = 0;
};

} // namespace auras::core

// std::hash specialization for use in unordered containers
namespace std {
    template<>
    struct hash<auras::core::UUID> {
        [[nodiscard]] size_t operator()(const auras::core::UUID& uuid) const noexcept {
            return uuid.hash();
        }
    };
} // namespace std
