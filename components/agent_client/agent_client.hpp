/**
 * @file agent_client.hpp
 * @brief Unprivileged side of the agent channel
 *
 * One connection per request. An agent that is not running (no socket, or
 * nobody listening) is reported as BATTCTL_ERR_AGENT_UNAVAILABLE so callers
 * can tell it apart from a request the agent refused.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "agent_protocol.hpp"
#include "battctl_err.h"
#include "control_result.hpp"

namespace battctl {

class AgentClient {
public:
    struct Options {
        std::string socket_path;
        std::chrono::milliseconds timeout{5000};
    };

    explicit AgentClient(Options options);

    battctl_err_t send(const ControlRequest &request, ControlResponse &response);

    ControlResult set_charge_limit(int percent);
    ControlResult set_charging_enabled(bool enabled);

    std::optional<StatusReply> get_status();
    std::optional<std::string> get_version();

    /// JSON diagnostics report produced by the agent
    std::optional<std::string> run_diagnostics();

private:
    battctl_err_t connect_socket(int &fd);
    battctl_err_t read_line(int fd, std::string &line);
    ControlResult to_result(battctl_err_t err, const ControlResponse &response);

    Options options_;
};

} // namespace battctl
