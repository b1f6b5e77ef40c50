/**
 * @file smc_types.cpp
 * @brief Register key and type code tables
 */

#include "smc_types.hpp"

namespace battctl {

namespace {

struct TypeDescriptor {
    RegisterType type;
    std::string_view code_name;
    size_t length;
};

constexpr std::array<TypeDescriptor, 9> kTypeCatalog = {{
    {RegisterType::UInt8, "ui8 ", 1},
    {RegisterType::UInt16, "ui16", 2},
    {RegisterType::UInt32, "ui32", 4},
    {RegisterType::Float32, "flt ", 4},
    {RegisterType::FixedPointTemperature, "sp78", 2},
    {RegisterType::Hex8, "hex_", 1},
    {RegisterType::CharString, "ch8*", 0},
    {RegisterType::SInt8, "si8 ", 1},
    {RegisterType::Flag, "flag", 1},
}};

const TypeDescriptor *find_descriptor(RegisterType type)
{
    for (const auto &desc : kTypeCatalog) {
        if (desc.type == type) {
            return &desc;
        }
    }
    return nullptr;
}

uint32_t pack_code(std::string_view text)
{
    uint32_t code = 0;
    for (char c : text) {
        code = (code << 8) | static_cast<uint8_t>(c);
    }
    return code;
}

} // namespace

std::optional<RegisterKey> RegisterKey::parse(std::string_view text)
{
    if (text.size() != constants::kSmcKeyLength) {
        return std::nullopt;
    }
    return RegisterKey::from_code(pack_code(text));
}

std::string RegisterKey::to_string() const
{
    std::string text(constants::kSmcKeyLength, '\0');
    for (size_t i = 0; i < constants::kSmcKeyLength; ++i) {
        text[i] = static_cast<char>((code_ >> (8 * (3 - i))) & 0xFF);
    }
    return text;
}

size_t register_type_length(RegisterType type)
{
    const auto *desc = find_descriptor(type);
    return desc != nullptr ? desc->length : 0;
}

std::string_view register_type_code_name(RegisterType type)
{
    const auto *desc = find_descriptor(type);
    return desc != nullptr ? desc->code_name : std::string_view{"????"};
}

uint32_t register_type_code(RegisterType type)
{
    const auto *desc = find_descriptor(type);
    return desc != nullptr ? pack_code(desc->code_name) : 0;
}

RegisterType register_type_from_code(uint32_t code)
{
    for (const auto &desc : kTypeCatalog) {
        if (pack_code(desc.code_name) == code) {
            return desc.type;
        }
    }
    return RegisterType::Unknown;
}

} // namespace battctl
