/**
 * @file agent_server.hpp
 * @brief Unix domain socket listener of the privileged agent
 *
 * State machine:
 *
 *     Idle --start()--> Listening --accept--> Serving --close--> Listening
 *                           \--stop()--> Idle
 *
 * Connections are served one at a time. Each one is validated before any of
 * its bytes are read; rejected peers are closed without a reply. Requests are
 * newline-delimited JSON and each is answered before the next is read.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "agent_protocol.hpp"
#include "battctl_err.h"
#include "connection_validator.hpp"
#include "request_handler.hpp"

namespace battctl {

enum class AgentState : uint8_t {
    Idle,
    Listening,
    Serving,
};

const char *agent_state_name(AgentState state);

class AgentServer {
public:
    struct Options {
        std::string socket_path;
        std::chrono::milliseconds receive_timeout{5000};
        int backlog{8};
    };

    struct Stats {
        uint32_t connections_accepted;
        uint32_t connections_rejected;
        uint32_t requests_served;
        uint32_t request_errors;
        uint32_t protocol_errors;
    };

    AgentServer(Options options, ConnectionValidator &validator, RequestHandler &handler);
    ~AgentServer();

    AgentServer(const AgentServer &) = delete;
    AgentServer &operator=(const AgentServer &) = delete;

    /// Binds and listens on the socket path, replacing a stale socket file
    battctl_err_t start();

    /// Accept loop. Returns after stop(); never returns early on a per-connection error.
    battctl_err_t run();

    /// Safe from any thread or signal handler
    void stop();

    /**
     * @brief Validates and serves one already-connected socket
     *
     * Takes ownership of fd and closes it before returning.
     */
    void serve_connection(int fd);

    AgentState state() const { return state_.load(std::memory_order_acquire); }
    Stats get_stats() const;

private:
    void serve_requests(int fd);
    ControlResponse process_line(const std::string &line);
    bool send_line(int fd, const std::string &line);
    void close_listener();

    Options options_;
    ConnectionValidator &validator_;
    RequestHandler &handler_;

    int listen_fd_{-1};
    int wake_pipe_[2]{-1, -1};
    std::atomic<bool> stop_requested_{false};
    std::atomic<AgentState> state_{AgentState::Idle};

    std::atomic<uint32_t> connections_accepted_{0};
    std::atomic<uint32_t> connections_rejected_{0};
    std::atomic<uint32_t> requests_served_{0};
    std::atomic<uint32_t> request_errors_{0};
    std::atomic<uint32_t> protocol_errors_{0};
};

} // namespace battctl
