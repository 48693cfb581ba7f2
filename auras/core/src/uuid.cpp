#include <auras/core/uuid.hpp>
#include <mutex>
#include <random>

namespace auras::core {

namespace {
    std::mutex g_uuid_mutex;

    // Initialize lazily to avoid static initialization order issues
    std::mt19937_64& get_generator() {
        static std::random_device rd;
        static std::mt19937_64 gen(rd());
        return gen;
    }

    constexpr int hex_to_nibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    constexpr char nibble_to_hex(uint64_t nibble) {
        return "0123456789abcdef"[nibble & 0x0F];
    }
} // anonymous namespace

UUID UUID::generate() {
    uint64_t high = 0;
    uint64_t low = 0;
    {
        std::lock_guard<std::mutex> lock(g_uuid_mutex);
        std::uniform_int_distribution<uint64_t> dist;
        high = dist(get_generator());
        low = dist(get_generator());
    }

    // Version 4: high nibble of byte 6 = 0100
    high = (high & ~0x000000000000F000ULL) | 0x0000000000004000ULL;
    // Variant 1: top two bits of byte 8 = 10
    low = (low & ~0xC000000000000000ULL) | 0x8000000000000000ULL;

    return from_u64(high, low);
}

std::optional<UUID> UUID::from_string(std::string_view str) {
    if (str.size() != STRING_SIZE && str.size() != 32) {
        return std::nullopt;
    }

    uint64_t words[2] = {0, 0};
    size_t digits = 0;

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '-') {
            // Hyphens only at 8, 13, 18, 23 in the long form
            if (str.size() != STRING_SIZE || (i != 8 && i != 13 && i != 18 && i != 23)) {
                return std::nullopt;
            }
            continue;
        }

        int nibble = hex_to_nibble(str[i]);
        if (nibble < 0 || digits >= 32) {
            return std::nullopt;
        }

        uint64_t& word = words[digits / 16];
        word = (word << 4) | static_cast<uint64_t>(nibble);
        ++digits;
    }

    if (digits != 32) {
        return std::nullopt;
    }

    return from_u64(words[0], words[1]);
}

std::string UUID::to_string() const {
    std::string result;
    result.reserve(STRING_SIZE);

    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            result += '-';
        }
        const uint64_t word = i < 16 ? m_high : m_low;
        const int shift = 60 - (i % 16) * 4;
        result += nibble_to_hex(word >> shift);
    }

    return result;
}

size_t UUID::hash() const noexcept {
    size_t h = static_cast<size_t>(m_high);
    h ^= static_cast<size_t>(m_low) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

} // namespace auras::core
