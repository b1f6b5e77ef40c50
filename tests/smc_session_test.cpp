#include <cstddef>

#include "fake_smc.hpp"
#include "smc_codec.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using battctl::RegisterKey;
using battctl::RegisterType;
using battctl::SmcCommand;

TEST_CASE("parameter block matches the kernel layout")
{
    CHECK(sizeof(smc_param_struct_t) == 80);
    CHECK(offsetof(smc_param_struct_t, key_info) == 28);
    CHECK(offsetof(smc_param_struct_t, data8) == 42);
    CHECK(offsetof(smc_param_struct_t, bytes) == 48);
}

TEST_CASE("calls fail while disconnected and never reach the transport")
{
    test::FakeSmc smc;
    smc.add_key("BCLM", RegisterType::UInt8, {80});

    battctl::RegisterValue value;
    const auto status = smc.read_key(RegisterKey{"BCLM"}, value);
    CHECK(status.err == BATTCTL_ERR_NOT_OPEN);
    CHECK(smc.total_calls() == 0);
}

TEST_CASE("read_key sizes the read from the key info record")
{
    test::FakeSmc smc;
    smc.add_key("B0CT", RegisterType::UInt16, {0x01, 0x2C});
    REQUIRE(smc.connect());

    battctl::RegisterValue value;
    REQUIRE(static_cast<bool>(smc.read_key(RegisterKey{"B0CT"}, value)));
    CHECK(value.type == RegisterType::UInt16);
    CHECK(value.length == 2);
    CHECK(smc.calls(SmcCommand::GetKeyInfo) == 1);
    CHECK(smc.calls(SmcCommand::ReadKey) == 1);

    uint16_t cycles = 0;
    CHECK(battctl::decode_uint16(value, cycles) == BATTCTL_OK);
    CHECK(cycles == 300);
}

TEST_CASE("controller result bytes become error codes")
{
    test::FakeSmc smc;
    REQUIRE(smc.connect());

    battctl::RegisterInfo info;
    auto status = smc.read_key_info(RegisterKey{"ZZZZ"}, info);
    CHECK(status.err == BATTCTL_ERR_NOT_FOUND);
    CHECK(status.os_status == SMC_RESULT_KEY_NOT_FOUND);

    smc.add_key("CH0B", RegisterType::Hex8, {0});
    battctl::RegisterValue too_long;
    REQUIRE(battctl::encode_integer(RegisterType::UInt16, 1, too_long) == BATTCTL_OK);
    status = smc.write_key(RegisterKey{"CH0B"}, too_long);
    CHECK(status.err == BATTCTL_ERR_CALL_FAILED);
    CHECK(status.os_status == SMC_RESULT_ERROR);

    CHECK(smc.get_stats().not_found == 1);
    CHECK(smc.get_stats().failures == 1);
}

TEST_CASE("transport failures carry the OS status")
{
    test::FakeSmc smc;
    smc.add_key("BCLM", RegisterType::UInt8, {80});
    REQUIRE(smc.connect());
    smc.transport_failure = true;

    battctl::RegisterInfo info;
    const auto status = smc.read_key_info(RegisterKey{"BCLM"}, info);
    CHECK(status.err == BATTCTL_ERR_CALL_FAILED);
    CHECK(status.os_status == 0xe00002c2u);
}

TEST_CASE("connect and disconnect are idempotent")
{
    test::FakeSmc smc;
    CHECK(smc.connect());
    CHECK(smc.connect());
    CHECK(smc.is_connected());
    smc.disconnect();
    smc.disconnect();
    CHECK(!smc.is_connected());
}
