#include <string>

#include "agent_protocol.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using battctl::ControlRequest;
using battctl::ControlResponse;
using battctl::Operation;

TEST_CASE("requests encode as one JSON line")
{
    std::string line;
    REQUIRE(battctl::encode_request(ControlRequest{Operation::SetChargeLimit, 80}, line) == BATTCTL_OK);
    CHECK(line == "{\"operation\":\"setChargeLimit\",\"value\":80}\n");

    REQUIRE(battctl::encode_request(ControlRequest{Operation::GetStatus, std::nullopt}, line) == BATTCTL_OK);
    CHECK(line == "{\"operation\":\"getStatus\"}\n");
}

TEST_CASE("request decoding accepts the action alias")
{
    ControlRequest request;
    std::string error;
    REQUIRE(battctl::decode_request("{\"action\":\"setChargingEnabled\",\"value\":0}\n", request, error) ==
            BATTCTL_OK);
    CHECK(request.operation == Operation::SetChargingEnabled);
    CHECK(request.value == std::optional<int>(0));
}

TEST_CASE("malformed requests are rejected with a reason")
{
    ControlRequest request;
    std::string error;

    CHECK(battctl::decode_request("not json", request, error) == BATTCTL_ERR_PROTOCOL);
    CHECK(error == "Malformed request");

    CHECK(battctl::decode_request("[1,2]", request, error) == BATTCTL_ERR_PROTOCOL);

    CHECK(battctl::decode_request("{\"value\":1}", request, error) == BATTCTL_ERR_PROTOCOL);
    CHECK(error == "Missing operation");

    CHECK(battctl::decode_request("{\"operation\":\"reboot\"}", request, error) == BATTCTL_ERR_PROTOCOL);
    CHECK(error == "Unknown operation: reboot");

    CHECK(battctl::decode_request("{\"operation\":\"setChargeLimit\"}", request, error) == BATTCTL_ERR_PROTOCOL);
    CHECK(error == "Missing value");

    CHECK(battctl::decode_request("{\"operation\":\"setChargeLimit\",\"value\":\"80\"}", request, error) ==
          BATTCTL_ERR_PROTOCOL);
    CHECK(battctl::decode_request("{\"operation\":\"setChargeLimit\",\"value\":80.5}", request, error) ==
          BATTCTL_ERR_PROTOCOL);

    CHECK(battctl::decode_request("{\"operation\":\"setChargingEnabled\",\"value\":2}", request, error) ==
          BATTCTL_ERR_PROTOCOL);
    CHECK(error == "Value must be 0 or 1");
}

TEST_CASE("status replies omit unavailable fields")
{
    battctl::StatusReply status;
    status.charge_limit = 80;
    status.available_keys = {"BCLM", "CH0B"};

    std::string line;
    REQUIRE(battctl::encode_response(ControlResponse{true, std::nullopt, status}, line) == BATTCTL_OK);
    CHECK(line == "{\"success\":true,\"data\":{\"chargeLimit\":\"80\",\"availableKeys\":\"BCLM,CH0B\"}}\n");

    ControlResponse decoded;
    REQUIRE(battctl::decode_response(line, Operation::GetStatus, decoded) == BATTCTL_OK);
    CHECK(decoded.success);
    CHECK(!decoded.message.has_value());
    const auto *reply = std::get_if<battctl::StatusReply>(&decoded.payload);
    REQUIRE(reply != nullptr);
    CHECK(reply->charge_limit == std::optional<int>(80));
    CHECK(!reply->charging_enabled.has_value());
    CHECK(!reply->temperature.has_value());
    CHECK(reply->available_keys == std::vector<std::string>{"BCLM", "CH0B"});
}

TEST_CASE("status temperature and enable flag travel as strings")
{
    battctl::StatusReply status;
    status.charging_enabled = false;
    status.temperature = 31.3;

    std::string line;
    REQUIRE(battctl::encode_response(ControlResponse{true, std::nullopt, status}, line) == BATTCTL_OK);
    CHECK(line.find("\"chargingEnabled\":\"false\"") != std::string::npos);
    CHECK(line.find("\"temperature\":\"31.3\"") != std::string::npos);

    ControlResponse decoded;
    REQUIRE(battctl::decode_response(line, Operation::GetStatus, decoded) == BATTCTL_OK);
    const auto *reply = std::get_if<battctl::StatusReply>(&decoded.payload);
    REQUIRE(reply != nullptr);
    CHECK(reply->charging_enabled == std::optional<bool>(false));
    REQUIRE(reply->temperature.has_value());
    CHECK(*reply->temperature == doctest::Approx(31.3));
}

TEST_CASE("error responses carry a message and no data")
{
    std::string line;
    REQUIRE(battctl::encode_response(ControlResponse::error("Root privileges required"), line) == BATTCTL_OK);
    CHECK(line == "{\"success\":false,\"message\":\"Root privileges required\"}\n");

    ControlResponse decoded;
    REQUIRE(battctl::decode_response(line, Operation::SetChargeLimit, decoded) == BATTCTL_OK);
    CHECK(!decoded.success);
    CHECK(decoded.message == std::optional<std::string>("Root privileges required"));
    CHECK(std::holds_alternative<std::monostate>(decoded.payload));
}

TEST_CASE("failure status travels in the data object")
{
    std::string line;
    REQUIRE(battctl::encode_response(ControlResponse::error("Root privileges required", "requires_elevated_privilege"),
                                     line) == BATTCTL_OK);
    CHECK(line == "{\"success\":false,\"message\":\"Root privileges required\","
                  "\"data\":{\"status\":\"requires_elevated_privilege\"}}\n");

    ControlResponse decoded;
    REQUIRE(battctl::decode_response(line, Operation::SetChargeLimit, decoded) == BATTCTL_OK);
    CHECK(!decoded.success);
    CHECK(decoded.status == std::optional<std::string>("requires_elevated_privilege"));
    CHECK(std::holds_alternative<std::monostate>(decoded.payload));

    REQUIRE(battctl::decode_response("{\"success\":false,\"message\":\"x\"}", Operation::SetChargeLimit, decoded) ==
            BATTCTL_OK);
    CHECK(!decoded.status.has_value());
}

TEST_CASE("version replies decode into the version variant")
{
    ControlResponse decoded;
    REQUIRE(battctl::decode_response("{\"success\":true,\"data\":{\"version\":\"1.0.0\"}}", Operation::GetVersion,
                                     decoded) == BATTCTL_OK);
    const auto *reply = std::get_if<battctl::VersionReply>(&decoded.payload);
    REQUIRE(reply != nullptr);
    CHECK(reply->version == "1.0.0");

    CHECK(battctl::decode_response("{\"message\":\"x\"}", Operation::GetVersion, decoded) == BATTCTL_ERR_PROTOCOL);
    CHECK(battctl::decode_response("{\"success\":true,\"data\":[]}", Operation::GetVersion, decoded) ==
          BATTCTL_ERR_PROTOCOL);
}

TEST_CASE("line buffer splits frames and enforces the size limit")
{
    battctl::LineBuffer buffer(16);

    REQUIRE(buffer.append("abc\nde", 6) == BATTCTL_OK);
    CHECK(buffer.next_line() == std::optional<std::string>("abc"));
    CHECK(!buffer.next_line().has_value());

    REQUIRE(buffer.append("f\n", 2) == BATTCTL_OK);
    CHECK(buffer.next_line() == std::optional<std::string>("def"));
    CHECK(buffer.empty());

    const std::string oversized(17, 'x');
    CHECK(buffer.append(oversized.data(), oversized.size()) == BATTCTL_ERR_INVALID_SIZE);

    battctl::LineBuffer complete(16);
    const std::string framed = oversized + "\n";
    CHECK(complete.append(framed.data(), framed.size()) == BATTCTL_ERR_INVALID_SIZE);
}
