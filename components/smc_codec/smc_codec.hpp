/**
 * @file smc_codec.hpp
 * @brief Conversion between raw SMC payloads and native values
 *
 * Decoders never interpret a payload partially: the value's type must be the
 * decoder's type and its length must equal the type's declared length,
 * otherwise BATTCTL_ERR_TYPE_MISMATCH or BATTCTL_ERR_INVALID_SIZE is returned
 * and the output is left untouched.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "battctl_err.h"
#include "smc_types.hpp"

namespace battctl {

battctl_err_t decode_uint8(const RegisterValue &value, uint8_t &out);
battctl_err_t decode_uint16(const RegisterValue &value, uint16_t &out);
battctl_err_t decode_uint32(const RegisterValue &value, uint32_t &out);
battctl_err_t decode_sint8(const RegisterValue &value, int8_t &out);
battctl_err_t decode_hex8(const RegisterValue &value, uint8_t &out);
battctl_err_t decode_flag(const RegisterValue &value, bool &out);
battctl_err_t decode_float32(const RegisterValue &value, float &out);

/// sp78: signed 16-bit big-endian, 8 fractional bits
battctl_err_t decode_temperature(const RegisterValue &value, double &out);

/// ch8*: bytes up to the first NUL or the payload length
battctl_err_t decode_string(const RegisterValue &value, std::string &out);

/**
 * @brief Encodes an integer for an integral register type
 *
 * Valid for UInt8, UInt16, UInt32, SInt8, Hex8 and Flag. Values outside the
 * type's range yield BATTCTL_ERR_INVALID_ARG.
 */
battctl_err_t encode_integer(RegisterType type, int64_t native, RegisterValue &out);

/// Valid for Float32 and FixedPointTemperature
battctl_err_t encode_real(RegisterType type, double native, RegisterValue &out);

/// Valid for CharString, at most 32 bytes
battctl_err_t encode_string(std::string_view native, RegisterValue &out);

/// Debug rendering of a payload ("ui8  0x50 (80)")
std::string format_register_value(const RegisterValue &value);

} // namespace battctl
