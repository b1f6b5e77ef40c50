#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

#include "agent_config.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using battctl::AgentConfig;
using battctl::ConfigManager;
using battctl::Validator;

namespace {

std::string write_temp_file(const char *name, const std::string &contents)
{
    const std::string path = "/tmp/battctl-" + std::string(name) + "-" + std::to_string(getpid()) + ".json";
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
    return path;
}

} // namespace

TEST_CASE("defaults describe a locked-down agent")
{
    const AgentConfig cfg = ConfigManager::defaults();
    CHECK(cfg.socket_path == battctl::constants::kDefaultSocketPath);
    CHECK(cfg.allowed_uids.empty());
    CHECK(!cfg.allowed_gid.has_value());
    CHECK(cfg.request_timeout_ms == 5000);
    CHECK(cfg.telemetry_timeout_ms == 2000);
    CHECK(cfg.telemetry_cache_ms == 300000);
    CHECK(cfg.log_level == "info");
    CHECK(!cfg.log_to_stderr);
    CHECK(Validator::validate(cfg));
}

TEST_CASE("a complete configuration is applied")
{
    ConfigManager manager;
    const char *json = R"({
        "socket_path": "/tmp/battctl-agent.sock",
        "allowed_uids": [501, 502],
        "allowed_gid": 80,
        "request_timeout_ms": 1500,
        "telemetry_timeout_ms": 250,
        "telemetry_cache_ms": 0,
        "log_level": "debug",
        "log_to_stderr": true
    })";

    REQUIRE(manager.load_from_string(json) == BATTCTL_OK);

    const AgentConfig cfg = manager.get();
    CHECK(cfg.socket_path == "/tmp/battctl-agent.sock");
    CHECK(cfg.allowed_uids == std::vector<uint32_t>{501, 502});
    CHECK(cfg.allowed_gid == std::optional<uint32_t>(80));
    CHECK(manager.get_request_timeout_ms() == 1500);
    CHECK(manager.get_telemetry_timeout_ms() == 250);
    CHECK(manager.get_telemetry_cache_ms() == 0);
    CHECK(cfg.log_level == "debug");
    CHECK(cfg.log_to_stderr);
    CHECK(manager.last_error().empty());
    CHECK(manager.get_stats().loads == 1);
}

TEST_CASE("omitted keys fall back to defaults")
{
    ConfigManager manager;
    REQUIRE(manager.load_from_string(R"({"allowed_uids": [501]})") == BATTCTL_OK);
    CHECK(manager.get_socket_path() == battctl::constants::kDefaultSocketPath);
    CHECK(manager.get().allowed_uids == std::vector<uint32_t>{501});
    CHECK(manager.get_request_timeout_ms() == battctl::constants::kRequestTimeoutDefaultMs);
}

TEST_CASE("rejected configurations keep the previous one")
{
    ConfigManager manager;
    REQUIRE(manager.load_from_string(R"({"request_timeout_ms": 2000})") == BATTCTL_OK);

    SUBCASE("not an object")
    {
        CHECK(manager.load_from_string("[1, 2, 3]") == BATTCTL_ERR_INVALID_ARG);
        CHECK(manager.load_from_string("{ broken") == BATTCTL_ERR_INVALID_ARG);
        CHECK(manager.get_stats().parse_failures == 2);
    }

    SUBCASE("wrong types")
    {
        CHECK(manager.load_from_string(R"({"request_timeout_ms": "fast"})") == BATTCTL_ERR_INVALID_ARG);
        CHECK(manager.last_error() == "request_timeout_ms has the wrong type");
        CHECK(manager.load_from_string(R"({"allowed_uids": [501, -1]})") == BATTCTL_ERR_INVALID_ARG);
        CHECK(manager.load_from_string(R"({"allowed_gid": 80.5})") == BATTCTL_ERR_INVALID_ARG);
        CHECK(manager.last_error() == "allowed_gid has the wrong type");
        CHECK(manager.load_from_string(R"({"log_to_stderr": 1})") == BATTCTL_ERR_INVALID_ARG);
        CHECK(manager.get_stats().parse_failures == 4);
    }

    SUBCASE("out of range values")
    {
        CHECK(manager.load_from_string(R"({"request_timeout_ms": 50})") == BATTCTL_ERR_INVALID_ARG);
        CHECK(manager.last_error() == "request_timeout_ms out of range");
        CHECK(manager.load_from_string(R"({"telemetry_timeout_ms": 30001})") == BATTCTL_ERR_INVALID_ARG);
        CHECK(manager.load_from_string(R"({"telemetry_cache_ms": 3600001})") == BATTCTL_ERR_INVALID_ARG);
        CHECK(manager.load_from_string(R"({"log_level": "verbose"})") == BATTCTL_ERR_INVALID_ARG);
        CHECK(manager.get_stats().validation_failures == 4);
    }

    SUBCASE("unusable socket paths")
    {
        CHECK(manager.load_from_string(R"({"socket_path": "relative.sock"})") == BATTCTL_ERR_INVALID_ARG);
        CHECK(manager.load_from_string(R"({"socket_path": ""})") == BATTCTL_ERR_INVALID_ARG);
        const std::string too_long = "{\"socket_path\": \"/" + std::string(200, 'a') + "\"}";
        CHECK(manager.load_from_string(too_long) == BATTCTL_ERR_INVALID_ARG);
        CHECK(manager.get_stats().validation_failures == 3);
    }

    CHECK(manager.get_request_timeout_ms() == 2000);
    CHECK(manager.get_stats().loads == 1);
}

TEST_CASE("configuration files")
{
    ConfigManager manager;

    SUBCASE("a missing file keeps the defaults")
    {
        const std::string path = "/tmp/battctl-missing-" + std::to_string(getpid()) + ".json";
        CHECK(manager.load_file(path) == BATTCTL_OK);
        CHECK(manager.get_socket_path() == battctl::constants::kDefaultSocketPath);
        CHECK(manager.get_stats().loads == 0);
    }

    SUBCASE("a valid file is loaded")
    {
        const std::string path = write_temp_file("valid", R"({"allowed_gid": 20, "log_level": "warn"})");
        CHECK(manager.load_file(path) == BATTCTL_OK);
        CHECK(manager.get().allowed_gid == std::optional<uint32_t>(20));
        CHECK(manager.get().log_level == "warn");
        std::remove(path.c_str());
    }

    SUBCASE("an invalid file is reported")
    {
        const std::string path = write_temp_file("invalid", R"({"log_level": 3})");
        CHECK(manager.load_file(path) == BATTCTL_ERR_INVALID_ARG);
        CHECK(manager.get().log_level == "info");
        std::remove(path.c_str());
    }
}
