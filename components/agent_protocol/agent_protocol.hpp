/**
 * @file agent_protocol.hpp
 * @brief Request/response messages exchanged with the privileged agent
 *
 * Each message is one JSON object terminated by '\n':
 *
 *     {"operation":"setChargeLimit","value":80}
 *     {"success":true,"message":"Charge limit set to 80%"}
 *     {"success":true,"data":{"chargeLimit":"80","chargingEnabled":"true"}}
 *     {"success":false,"message":"Root privileges required","data":{"status":"requires_elevated_privilege"}}
 *
 * Reply payloads are a closed set of typed variants; the string map on the
 * wire is produced and consumed only here.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "battctl_err.h"

namespace battctl {

namespace constants {
constexpr size_t kMaxFrameLength = 8192;
constexpr std::string_view kAgentVersion = "1.0.0";
} // namespace constants

enum class Operation : uint8_t {
    SetChargeLimit,
    SetChargingEnabled,
    GetStatus,
    GetVersion,
    RunDiagnostics,
};

const char *operation_name(Operation operation);
std::optional<Operation> operation_from_name(std::string_view name);

struct ControlRequest {
    Operation operation{Operation::GetStatus};
    std::optional<int> value;
};

struct StatusReply {
    std::optional<int> charge_limit;
    std::optional<bool> charging_enabled;
    std::optional<double> temperature;
    std::vector<std::string> available_keys;
};

struct VersionReply {
    std::string version;
};

struct DiagnosticsReply {
    std::string report;
};

using ReplyPayload = std::variant<std::monostate, StatusReply, VersionReply, DiagnosticsReply>;

struct ControlResponse {
    bool success{false};
    std::optional<std::string> message;
    ReplyPayload payload;
    /// Failure class carried as data.status, absent when the sender has none
    std::optional<std::string> status;

    static ControlResponse ok(std::string text)
    {
        return ControlResponse{true, std::move(text), std::monostate{}};
    }
    static ControlResponse error(std::string text)
    {
        return ControlResponse{false, std::move(text), std::monostate{}};
    }
    static ControlResponse error(std::string text, std::string status_name)
    {
        return ControlResponse{false, std::move(text), std::monostate{}, std::move(status_name)};
    }
};

// =============================================================================
// Encoding / decoding
// =============================================================================

/// Produces one line including the trailing '\n'
battctl_err_t encode_request(const ControlRequest &request, std::string &line);

/**
 * @brief Parses one request line (with or without trailing newline)
 *
 * Returns BATTCTL_ERR_PROTOCOL and a human readable reason in error when the
 * line is not valid JSON, names an unknown operation, or carries a missing or
 * out-of-domain value.
 */
battctl_err_t decode_request(std::string_view line, ControlRequest &request, std::string &error);

battctl_err_t encode_response(const ControlResponse &response, std::string &line);

/**
 * @brief Parses a response line
 *
 * The expected reply type is chosen by the operation that was sent.
 */
battctl_err_t decode_response(std::string_view line, Operation sent, ControlResponse &response);

// =============================================================================
// Framing
// =============================================================================

/**
 * @brief Accumulates stream bytes and yields complete lines
 */
class LineBuffer {
public:
    explicit LineBuffer(size_t max_line = constants::kMaxFrameLength)
        : max_line_(max_line)
    {
    }

    /// Returns BATTCTL_ERR_INVALID_SIZE once a line exceeds the limit
    battctl_err_t append(const char *data, size_t length);

    /// Pops the next complete line without its terminator
    std::optional<std::string> next_line();

    bool empty() const { return pending_.empty(); }

private:
    std::string pending_;
    size_t max_line_;
};

} // namespace battctl
