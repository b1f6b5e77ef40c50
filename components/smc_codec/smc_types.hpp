/**
 * @file smc_types.hpp
 * @brief Value types of the SMC register protocol
 *
 * A register is addressed by a four character key ("BCLM") and carries a
 * typed payload of at most 32 bytes. Keys and type codes travel on the wire
 * as big-endian packed 32-bit integers.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace battctl {

namespace constants {
constexpr size_t kSmcDataSize = 32;
constexpr size_t kSmcKeyLength = 4;
} // namespace constants

// =============================================================================
// Register key
// =============================================================================

class RegisterKey {
public:
    constexpr RegisterKey() = default;

    constexpr explicit RegisterKey(const char (&text)[constants::kSmcKeyLength + 1])
        : code_(pack(text[0], text[1], text[2], text[3]))
    {
    }

    /// Returns nullopt unless text is exactly four bytes long
    static std::optional<RegisterKey> parse(std::string_view text);

    static constexpr RegisterKey from_code(uint32_t code)
    {
        RegisterKey key;
        key.code_ = code;
        return key;
    }

    constexpr uint32_t code() const { return code_; }
    std::string to_string() const;

    constexpr bool operator==(const RegisterKey &other) const = default;

private:
    static constexpr uint32_t pack(char a, char b, char c, char d)
    {
        return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24) |
               (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16) |
               (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8) |
               static_cast<uint32_t>(static_cast<uint8_t>(d));
    }

    uint32_t code_{0};
};

// =============================================================================
// Register type
// =============================================================================

enum class RegisterType : uint8_t {
    UInt8,
    UInt16,
    UInt32,
    Float32,
    FixedPointTemperature,
    Hex8,
    CharString,
    SInt8,
    Flag,
    Unknown,
};

/**
 * @brief Declared payload length in bytes
 *
 * CharString is variable length and reports 0, as does Unknown.
 */
size_t register_type_length(RegisterType type);

/// Four character code as found in the key info record ("ui8 ", "sp78", ...)
std::string_view register_type_code_name(RegisterType type);

uint32_t register_type_code(RegisterType type);
RegisterType register_type_from_code(uint32_t code);

// =============================================================================
// Register value and info
// =============================================================================

struct RegisterValue {
    RegisterType type{RegisterType::Unknown};
    std::array<uint8_t, constants::kSmcDataSize> bytes{};
    size_t length{0};

    std::span<const uint8_t> data() const { return {bytes.data(), length}; }
};

struct RegisterInfo {
    uint32_t data_size{0};
    uint32_t type_code{0};
    RegisterType type{RegisterType::Unknown};
    uint8_t attributes{0};
};

} // namespace battctl
