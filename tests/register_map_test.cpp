#include "fake_smc.hpp"
#include "register_map.hpp"
#include "smc_codec.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using battctl::HardwareVariant;
using battctl::RegisterKey;
using battctl::RegisterType;
using battctl::SmcCommand;

TEST_CASE("probe_exists reflects key info lookups only")
{
    test::FakeSmc smc;
    smc.add_key("BCLM", RegisterType::UInt8, {100});
    battctl::RegisterMap map(smc);

    CHECK(map.probe_exists(RegisterKey{"BCLM"}));
    CHECK(!map.probe_exists(RegisterKey{"CHWA"}));
    CHECK(smc.calls(SmcCommand::ReadKey) == 0);
}

TEST_CASE("primitives connect on demand and fail cleanly without a controller")
{
    test::FakeSmc smc;
    smc.add_key("BCLM", RegisterType::UInt8, {100});
    smc.refuse_connect = true;
    battctl::RegisterMap map(smc);

    battctl::RegisterValue value;
    CHECK(map.read(RegisterKey{"BCLM"}, value) == BATTCTL_ERR_NOT_OPEN);
    CHECK(!map.probe_exists(RegisterKey{"BCLM"}));
    CHECK(!map.resolve_variant().has_value());
    CHECK(smc.total_calls() == 0);

    smc.refuse_connect = false;
    CHECK(map.read(RegisterKey{"BCLM"}, value) == BATTCTL_OK);
}

TEST_CASE("variant resolution")
{
    SUBCASE("percentage register means WideRange")
    {
        test::FakeSmc smc;
        test::populate_wide_range(smc);
        battctl::RegisterMap map(smc);
        CHECK(map.resolve_variant() == HardwareVariant::WideRange);
    }

    SUBCASE("toggle register means BinaryRange")
    {
        test::FakeSmc smc;
        test::populate_binary_range(smc);
        battctl::RegisterMap map(smc);
        CHECK(map.resolve_variant() == HardwareVariant::BinaryRange);
    }

    SUBCASE("both present prefers WideRange")
    {
        test::FakeSmc smc;
        test::populate_wide_range(smc);
        smc.add_key("CHWA", RegisterType::UInt8, {0});
        battctl::RegisterMap map(smc);
        CHECK(map.resolve_variant() == HardwareVariant::WideRange);
    }

    SUBCASE("neither present is unsupported")
    {
        test::FakeSmc smc;
        smc.add_key("BNum", RegisterType::UInt8, {1});
        battctl::RegisterMap map(smc);
        CHECK(!map.resolve_variant().has_value());
    }
}

TEST_CASE("resolved variant is cached until invalidated")
{
    test::FakeSmc smc;
    test::populate_wide_range(smc);
    battctl::RegisterMap map(smc);

    REQUIRE(map.resolve_variant() == HardwareVariant::WideRange);
    const uint32_t lookups = smc.calls(SmcCommand::GetKeyInfo);
    REQUIRE(map.resolve_variant() == HardwareVariant::WideRange);
    CHECK(smc.calls(SmcCommand::GetKeyInfo) == lookups);

    smc.remove_key("BCLM");
    smc.add_key("CHWA", RegisterType::UInt8, {0});
    map.invalidate_variant();
    CHECK(map.resolve_variant() == HardwareVariant::BinaryRange);
}

TEST_CASE("list_available_keys follows catalog order")
{
    test::FakeSmc smc;
    test::populate_binary_range(smc);
    battctl::RegisterMap map(smc);

    const std::vector<std::string> expected{"CH0C", "CHWA", "BATP", "BNum", "TB0T", "TB1T", "B0CT"};
    CHECK(map.list_available_keys() == expected);
}

TEST_CASE("writes are refused when live metadata disagrees with the value")
{
    test::FakeSmc smc;
    smc.add_key("CH0B", RegisterType::Hex8, {0});
    battctl::RegisterMap map(smc);

    battctl::RegisterValue wrong_type;
    REQUIRE(battctl::encode_integer(RegisterType::UInt8, 1, wrong_type) == BATTCTL_OK);
    CHECK(map.write(RegisterKey{"CH0B"}, wrong_type) == BATTCTL_ERR_TYPE_MISMATCH);

    battctl::RegisterValue wrong_size;
    wrong_size.type = RegisterType::Hex8;
    wrong_size.length = 2;
    CHECK(map.write(RegisterKey{"CH0B"}, wrong_size) == BATTCTL_ERR_INVALID_SIZE);

    CHECK(smc.writes() == 0);

    battctl::RegisterValue right;
    REQUIRE(battctl::encode_integer(RegisterType::Hex8, 1, right) == BATTCTL_OK);
    CHECK(map.write(RegisterKey{"CH0B"}, right) == BATTCTL_OK);
    CHECK(smc.writes() == 1);
    CHECK(smc.bytes_of("CH0B") == std::vector<uint8_t>{0x01});
}

TEST_CASE("writing a missing key reports not found")
{
    test::FakeSmc smc;
    battctl::RegisterMap map(smc);

    battctl::RegisterValue value;
    REQUIRE(battctl::encode_integer(RegisterType::UInt8, 80, value) == BATTCTL_OK);
    CHECK(map.write(RegisterKey{"BCLM"}, value) == BATTCTL_ERR_NOT_FOUND);
    CHECK(smc.writes() == 0);
}

TEST_CASE("limit translation per variant")
{
    using battctl::charge_limit_from_raw;
    using battctl::charge_limit_to_raw;

    CHECK(charge_limit_to_raw(HardwareVariant::WideRange, 60) == std::optional<uint8_t>(60));
    CHECK(charge_limit_to_raw(HardwareVariant::BinaryRange, 100) == std::optional<uint8_t>(0));
    CHECK(charge_limit_to_raw(HardwareVariant::BinaryRange, 80) == std::optional<uint8_t>(1));
    CHECK(!charge_limit_to_raw(HardwareVariant::BinaryRange, 75).has_value());
    CHECK(!charge_limit_to_raw(HardwareVariant::WideRange, 19).has_value());

    CHECK(charge_limit_from_raw(HardwareVariant::BinaryRange, 0) == std::optional<int>(100));
    CHECK(charge_limit_from_raw(HardwareVariant::BinaryRange, 1) == std::optional<int>(80));
    CHECK(!charge_limit_from_raw(HardwareVariant::BinaryRange, 2).has_value());
    CHECK(charge_limit_from_raw(HardwareVariant::WideRange, 77) == std::optional<int>(77));

    CHECK(battctl::charge_enable_to_raw(true) == 0);
    CHECK(battctl::charge_enable_to_raw(false) == 1);
    CHECK(battctl::charge_enable_from_raw(0));
    CHECK(!battctl::charge_enable_from_raw(1));
}
