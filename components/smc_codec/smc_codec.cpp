/**
 * @file smc_codec.cpp
 * @brief Big-endian payload encoding and decoding
 */

#include "smc_codec.hpp"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <limits>

namespace battctl {

namespace {

battctl_err_t check_shape(const RegisterValue &value, RegisterType expected)
{
    if (value.type != expected) {
        return BATTCTL_ERR_TYPE_MISMATCH;
    }
    if (value.length != register_type_length(expected)) {
        return BATTCTL_ERR_INVALID_SIZE;
    }
    return BATTCTL_OK;
}

uint32_t read_be(const RegisterValue &value)
{
    uint32_t result = 0;
    for (size_t i = 0; i < value.length; ++i) {
        result = (result << 8) | value.bytes[i];
    }
    return result;
}

void write_be(RegisterValue &out, RegisterType type, uint32_t raw)
{
    const size_t length = register_type_length(type);
    out = RegisterValue{};
    out.type = type;
    out.length = length;
    for (size_t i = 0; i < length; ++i) {
        out.bytes[length - 1 - i] = static_cast<uint8_t>((raw >> (8 * i)) & 0xFF);
    }
}

bool integer_range(RegisterType type, int64_t &min, int64_t &max)
{
    switch (type) {
        case RegisterType::UInt8:
        case RegisterType::Hex8:
            min = 0;
            max = std::numeric_limits<uint8_t>::max();
            return true;
        case RegisterType::Flag:
            min = 0;
            max = 1;
            return true;
        case RegisterType::SInt8:
            min = std::numeric_limits<int8_t>::min();
            max = std::numeric_limits<int8_t>::max();
            return true;
        case RegisterType::UInt16:
            min = 0;
            max = std::numeric_limits<uint16_t>::max();
            return true;
        case RegisterType::UInt32:
            min = 0;
            max = std::numeric_limits<uint32_t>::max();
            return true;
        default:
            return false;
    }
}

} // namespace

// =============================================================================
// Decoding
// =============================================================================

battctl_err_t decode_uint8(const RegisterValue &value, uint8_t &out)
{
    const battctl_err_t err = check_shape(value, RegisterType::UInt8);
    if (err != BATTCTL_OK) {
        return err;
    }
    out = value.bytes[0];
    return BATTCTL_OK;
}

battctl_err_t decode_uint16(const RegisterValue &value, uint16_t &out)
{
    const battctl_err_t err = check_shape(value, RegisterType::UInt16);
    if (err != BATTCTL_OK) {
        return err;
    }
    out = static_cast<uint16_t>(read_be(value));
    return BATTCTL_OK;
}

battctl_err_t decode_uint32(const RegisterValue &value, uint32_t &out)
{
    const battctl_err_t err = check_shape(value, RegisterType::UInt32);
    if (err != BATTCTL_OK) {
        return err;
    }
    out = read_be(value);
    return BATTCTL_OK;
}

battctl_err_t decode_sint8(const RegisterValue &value, int8_t &out)
{
    const battctl_err_t err = check_shape(value, RegisterType::SInt8);
    if (err != BATTCTL_OK) {
        return err;
    }
    out = static_cast<int8_t>(value.bytes[0]);
    return BATTCTL_OK;
}

battctl_err_t decode_hex8(const RegisterValue &value, uint8_t &out)
{
    const battctl_err_t err = check_shape(value, RegisterType::Hex8);
    if (err != BATTCTL_OK) {
        return err;
    }
    out = value.bytes[0];
    return BATTCTL_OK;
}

battctl_err_t decode_flag(const RegisterValue &value, bool &out)
{
    const battctl_err_t err = check_shape(value, RegisterType::Flag);
    if (err != BATTCTL_OK) {
        return err;
    }
    out = value.bytes[0] != 0;
    return BATTCTL_OK;
}

battctl_err_t decode_float32(const RegisterValue &value, float &out)
{
    const battctl_err_t err = check_shape(value, RegisterType::Float32);
    if (err != BATTCTL_OK) {
        return err;
    }
    const uint32_t bits = read_be(value);
    static_assert(sizeof(bits) == sizeof(out), "float32 must be 4 bytes");
    std::memcpy(&out, &bits, sizeof(out));
    return BATTCTL_OK;
}

battctl_err_t decode_temperature(const RegisterValue &value, double &out)
{
    const battctl_err_t err = check_shape(value, RegisterType::FixedPointTemperature);
    if (err != BATTCTL_OK) {
        return err;
    }
    const auto raw = static_cast<int16_t>(read_be(value));
    out = static_cast<double>(raw) / 256.0;
    return BATTCTL_OK;
}

battctl_err_t decode_string(const RegisterValue &value, std::string &out)
{
    if (value.type != RegisterType::CharString) {
        return BATTCTL_ERR_TYPE_MISMATCH;
    }
    if (value.length > constants::kSmcDataSize) {
        return BATTCTL_ERR_INVALID_SIZE;
    }
    const auto *begin = reinterpret_cast<const char *>(value.bytes.data());
    out.assign(begin, strnlen(begin, value.length));
    return BATTCTL_OK;
}

// =============================================================================
// Encoding
// =============================================================================

battctl_err_t encode_integer(RegisterType type, int64_t native, RegisterValue &out)
{
    int64_t min = 0;
    int64_t max = 0;
    if (!integer_range(type, min, max)) {
        return BATTCTL_ERR_TYPE_MISMATCH;
    }
    if (native < min || native > max) {
        return BATTCTL_ERR_INVALID_ARG;
    }
    write_be(out, type, static_cast<uint32_t>(native));
    return BATTCTL_OK;
}

battctl_err_t encode_real(RegisterType type, double native, RegisterValue &out)
{
    if (std::isnan(native) || std::isinf(native)) {
        return BATTCTL_ERR_INVALID_ARG;
    }

    if (type == RegisterType::Float32) {
        const auto as_float = static_cast<float>(native);
        uint32_t bits = 0;
        std::memcpy(&bits, &as_float, sizeof(bits));
        write_be(out, type, bits);
        return BATTCTL_OK;
    }

    if (type == RegisterType::FixedPointTemperature) {
        const double scaled = std::round(native * 256.0);
        if (scaled < std::numeric_limits<int16_t>::min() || scaled > std::numeric_limits<int16_t>::max()) {
            return BATTCTL_ERR_INVALID_ARG;
        }
        const auto raw = static_cast<int16_t>(scaled);
        write_be(out, type, static_cast<uint16_t>(raw));
        return BATTCTL_OK;
    }

    return BATTCTL_ERR_TYPE_MISMATCH;
}

battctl_err_t encode_string(std::string_view native, RegisterValue &out)
{
    if (native.size() > constants::kSmcDataSize) {
        return BATTCTL_ERR_INVALID_SIZE;
    }
    out = RegisterValue{};
    out.type = RegisterType::CharString;
    out.length = native.size();
    std::memcpy(out.bytes.data(), native.data(), native.size());
    return BATTCTL_OK;
}

std::string format_register_value(const RegisterValue &value)
{
    std::string text(register_type_code_name(value.type));
    text += ' ';

    char buffer[48];
    switch (value.type) {
        case RegisterType::FixedPointTemperature: {
            double temp = 0.0;
            if (decode_temperature(value, temp) == BATTCTL_OK) {
                std::snprintf(buffer, sizeof(buffer), "%.2f", temp);
                return text + buffer;
            }
            break;
        }
        case RegisterType::Float32: {
            float real = 0.0f;
            if (decode_float32(value, real) == BATTCTL_OK) {
                std::snprintf(buffer, sizeof(buffer), "%.3f", static_cast<double>(real));
                return text + buffer;
            }
            break;
        }
        case RegisterType::CharString: {
            std::string str;
            if (decode_string(value, str) == BATTCTL_OK) {
                return text + '"' + str + '"';
            }
            break;
        }
        default:
            if (value.length > 0 && value.length <= 4) {
                const uint32_t raw = read_be(value);
                std::snprintf(buffer, sizeof(buffer), "0x%0*x (%u)", static_cast<int>(value.length * 2), raw, raw);
                return text + buffer;
            }
            break;
    }

    for (size_t i = 0; i < value.length; ++i) {
        std::snprintf(buffer, sizeof(buffer), "%02x", value.bytes[i]);
        text += buffer;
    }
    return text;
}

} // namespace battctl
