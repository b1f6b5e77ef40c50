#include <cmath>
#include <initializer_list>
#include <string>

#include "smc_codec.hpp"
#include "smc_types.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using battctl::RegisterKey;
using battctl::RegisterType;
using battctl::RegisterValue;

namespace {
RegisterValue make_value(RegisterType type, std::initializer_list<uint8_t> bytes)
{
    RegisterValue value;
    value.type = type;
    value.length = bytes.size();
    size_t i = 0;
    for (uint8_t b : bytes) {
        value.bytes[i++] = b;
    }
    return value;
}
} // namespace

TEST_CASE("register keys parse only four byte names")
{
    const auto key = RegisterKey::parse("BCLM");
    REQUIRE(key.has_value());
    CHECK(key->code() == 0x42434C4Du);
    CHECK(key->to_string() == "BCLM");
    CHECK(*key == RegisterKey{"BCLM"});
    CHECK(!(*key == RegisterKey{"CHWA"}));

    CHECK(!RegisterKey::parse("BCL").has_value());
    CHECK(!RegisterKey::parse("BCLMX").has_value());
    CHECK(!RegisterKey::parse("").has_value());
}

TEST_CASE("type codes map to register types and lengths")
{
    CHECK(battctl::register_type_from_code(0x75693820u) == RegisterType::UInt8);  // "ui8 "
    CHECK(battctl::register_type_from_code(0x73703738u) == RegisterType::FixedPointTemperature);
    CHECK(battctl::register_type_from_code(0x6865785Fu) == RegisterType::Hex8);
    CHECK(battctl::register_type_from_code(0x66707878u) == RegisterType::Unknown);  // "fpxx"

    CHECK(battctl::register_type_length(RegisterType::UInt8) == 1);
    CHECK(battctl::register_type_length(RegisterType::UInt16) == 2);
    CHECK(battctl::register_type_length(RegisterType::UInt32) == 4);
    CHECK(battctl::register_type_length(RegisterType::Float32) == 4);
    CHECK(battctl::register_type_length(RegisterType::FixedPointTemperature) == 2);
    CHECK(battctl::register_type_length(RegisterType::Hex8) == 1);
    CHECK(battctl::register_type_length(RegisterType::CharString) == 0);

    CHECK(battctl::register_type_code_name(RegisterType::Flag) == "flag");
    CHECK(battctl::register_type_from_code(battctl::register_type_code(RegisterType::SInt8)) == RegisterType::SInt8);
}

TEST_CASE("unsigned decoders are big-endian")
{
    uint8_t u8 = 0;
    CHECK(battctl::decode_uint8(make_value(RegisterType::UInt8, {0x50}), u8) == BATTCTL_OK);
    CHECK(u8 == 80);

    uint16_t u16 = 0;
    CHECK(battctl::decode_uint16(make_value(RegisterType::UInt16, {0x01, 0x2C}), u16) == BATTCTL_OK);
    CHECK(u16 == 300);

    uint32_t u32 = 0;
    CHECK(battctl::decode_uint32(make_value(RegisterType::UInt32, {0x00, 0x01, 0x00, 0x02}), u32) == BATTCTL_OK);
    CHECK(u32 == 65538u);
}

TEST_CASE("sp78 temperatures decode as signed 8.8 fixed point")
{
    double celsius = 0.0;
    CHECK(battctl::decode_temperature(make_value(RegisterType::FixedPointTemperature, {0x1E, 0x80}), celsius) ==
          BATTCTL_OK);
    CHECK(celsius == doctest::Approx(30.5));

    CHECK(battctl::decode_temperature(make_value(RegisterType::FixedPointTemperature, {0xFF, 0x00}), celsius) ==
          BATTCTL_OK);
    CHECK(celsius == doctest::Approx(-1.0));
}

TEST_CASE("float32 decodes big-endian IEEE bits")
{
    float real = 0.0f;
    CHECK(battctl::decode_float32(make_value(RegisterType::Float32, {0x41, 0x20, 0x00, 0x00}), real) == BATTCTL_OK);
    CHECK(real == doctest::Approx(10.0f));
}

TEST_CASE("decoders reject foreign types and wrong lengths without touching the output")
{
    uint8_t u8 = 42;
    CHECK(battctl::decode_uint8(make_value(RegisterType::Hex8, {0x01}), u8) == BATTCTL_ERR_TYPE_MISMATCH);
    CHECK(u8 == 42);

    CHECK(battctl::decode_uint8(make_value(RegisterType::UInt8, {0x01, 0x02}), u8) == BATTCTL_ERR_INVALID_SIZE);
    CHECK(u8 == 42);

    uint16_t u16 = 7;
    CHECK(battctl::decode_uint16(make_value(RegisterType::UInt16, {0x01}), u16) == BATTCTL_ERR_INVALID_SIZE);
    CHECK(u16 == 7);

    double celsius = 1.5;
    CHECK(battctl::decode_temperature(make_value(RegisterType::UInt16, {0x1E, 0x80}), celsius) ==
          BATTCTL_ERR_TYPE_MISMATCH);
    CHECK(celsius == doctest::Approx(1.5));

    bool flag = false;
    CHECK(battctl::decode_flag(make_value(RegisterType::Flag, {}), flag) == BATTCTL_ERR_INVALID_SIZE);
}

TEST_CASE("encoding produces left aligned zero padded payloads")
{
    RegisterValue value;
    REQUIRE(battctl::encode_integer(RegisterType::UInt16, 0x1234, value) == BATTCTL_OK);
    CHECK(value.type == RegisterType::UInt16);
    CHECK(value.length == 2);
    CHECK(value.bytes[0] == 0x12);
    CHECK(value.bytes[1] == 0x34);
    for (size_t i = 2; i < value.bytes.size(); ++i) {
        CHECK(value.bytes[i] == 0);
    }

    REQUIRE(battctl::encode_real(RegisterType::FixedPointTemperature, 30.5, value) == BATTCTL_OK);
    CHECK(value.length == 2);
    CHECK(value.bytes[0] == 0x1E);
    CHECK(value.bytes[1] == 0x80);
}

TEST_CASE("encoded values decode back to the same value")
{
    RegisterValue value;

    SUBCASE("unsigned integers at their bounds")
    {
        for (int64_t native : {0, 1, 255}) {
            REQUIRE(battctl::encode_integer(RegisterType::UInt8, native, value) == BATTCTL_OK);
            uint8_t decoded = 0xAA;
            REQUIRE(battctl::decode_uint8(value, decoded) == BATTCTL_OK);
            CHECK(decoded == native);
        }
        for (int64_t native : {0, 65535}) {
            REQUIRE(battctl::encode_integer(RegisterType::UInt16, native, value) == BATTCTL_OK);
            uint16_t decoded = 0xAAAA;
            REQUIRE(battctl::decode_uint16(value, decoded) == BATTCTL_OK);
            CHECK(decoded == native);
        }
    }

    SUBCASE("float32 zero and negatives")
    {
        for (double native : {0.0, -0.25, -12.5, -1024.0}) {
            REQUIRE(battctl::encode_real(RegisterType::Float32, native, value) == BATTCTL_OK);
            float decoded = 1.0f;
            REQUIRE(battctl::decode_float32(value, decoded) == BATTCTL_OK);
            CHECK(decoded == static_cast<float>(native));
        }
    }

    SUBCASE("sp78 temperatures below zero")
    {
        for (double native : {-10.5, -0.25, -40.0, 0.0, 25.0}) {
            REQUIRE(battctl::encode_real(RegisterType::FixedPointTemperature, native, value) == BATTCTL_OK);
            double decoded = 99.0;
            REQUIRE(battctl::decode_temperature(value, decoded) == BATTCTL_OK);
            CHECK(decoded == doctest::Approx(native));
        }
    }
}

TEST_CASE("encoding rejects values outside the type range")
{
    RegisterValue value;
    CHECK(battctl::encode_integer(RegisterType::UInt8, 300, value) == BATTCTL_ERR_INVALID_ARG);
    CHECK(battctl::encode_integer(RegisterType::UInt8, -1, value) == BATTCTL_ERR_INVALID_ARG);
    CHECK(battctl::encode_integer(RegisterType::Flag, 2, value) == BATTCTL_ERR_INVALID_ARG);
    CHECK(battctl::encode_integer(RegisterType::SInt8, -128, value) == BATTCTL_OK);
    CHECK(battctl::encode_integer(RegisterType::FixedPointTemperature, 1, value) == BATTCTL_ERR_TYPE_MISMATCH);
    CHECK(battctl::encode_real(RegisterType::FixedPointTemperature, 200.0, value) == BATTCTL_ERR_INVALID_ARG);
    CHECK(battctl::encode_real(RegisterType::UInt8, 1.0, value) == BATTCTL_ERR_TYPE_MISMATCH);
    CHECK(battctl::encode_string(std::string(33, 'x'), value) == BATTCTL_ERR_INVALID_SIZE);
}

TEST_CASE("character strings stop at the first NUL")
{
    RegisterValue value;
    REQUIRE(battctl::encode_string("M1 ", value) == BATTCTL_OK);
    value.length = 6;

    std::string text;
    CHECK(battctl::decode_string(value, text) == BATTCTL_OK);
    CHECK(text == "M1 ");
}

TEST_CASE("format_register_value renders numbers and temperatures")
{
    CHECK(battctl::format_register_value(make_value(RegisterType::UInt8, {0x50})) == "ui8  0x50 (80)");
    CHECK(battctl::format_register_value(make_value(RegisterType::FixedPointTemperature, {0x1E, 0x80})) ==
          "sp78 30.50");
}
