/**
 * @file agent_server.cpp
 * @brief Agent accept loop and per-connection request processing
 */

#include "agent_server.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>

#include "battctl_log.h"

namespace battctl {

namespace {
const char *TAG = "agent_server";

#if defined(MSG_NOSIGNAL)
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

void set_cloexec_nonblock(int fd)
{
    const int fd_flags = fcntl(fd, F_GETFD);
    if (fd_flags >= 0) {
        fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC);
    }
    const int fl_flags = fcntl(fd, F_GETFL);
    if (fl_flags >= 0) {
        fcntl(fd, F_SETFL, fl_flags | O_NONBLOCK);
    }
}

void suppress_sigpipe(int fd)
{
#if defined(SO_NOSIGPIPE)
    const int on = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &on, sizeof(on)) != 0) {
        BATTCTL_LOGW(TAG, "SO_NOSIGPIPE failed: %s", std::strerror(errno));
    }
#else
    (void)fd;
#endif
}

} // namespace

const char *agent_state_name(AgentState state)
{
    switch (state) {
        case AgentState::Idle:
            return "idle";
        case AgentState::Listening:
            return "listening";
        case AgentState::Serving:
            return "serving";
    }
    return "unknown";
}

AgentServer::AgentServer(Options options, ConnectionValidator &validator, RequestHandler &handler)
    : options_(std::move(options))
    , validator_(validator)
    , handler_(handler)
{
}

AgentServer::~AgentServer()
{
    close_listener();
    for (int &fd : wake_pipe_) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
}

// =============================================================================
// Listener
// =============================================================================

battctl_err_t AgentServer::start()
{
    if (listen_fd_ >= 0) {
        return BATTCTL_ERR_INVALID_STATE;
    }

    sockaddr_un addr{};
    if (options_.socket_path.empty() || options_.socket_path.size() >= sizeof(addr.sun_path)) {
        BATTCTL_LOGE(TAG, "Invalid socket path '%s'", options_.socket_path.c_str());
        return BATTCTL_ERR_INVALID_ARG;
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, options_.socket_path.c_str(), options_.socket_path.size() + 1);

    if (wake_pipe_[0] < 0) {
        if (pipe(wake_pipe_) != 0) {
            BATTCTL_LOGE(TAG, "pipe failed: %s", std::strerror(errno));
            return BATTCTL_FAIL;
        }
        set_cloexec_nonblock(wake_pipe_[0]);
        set_cloexec_nonblock(wake_pipe_[1]);
    } else {
        char drain[16];
        while (read(wake_pipe_[0], drain, sizeof(drain)) > 0) {
        }
    }

    struct stat st {};
    if (lstat(options_.socket_path.c_str(), &st) == 0) {
        if (!S_ISSOCK(st.st_mode)) {
            BATTCTL_LOGE(TAG, "%s exists and is not a socket", options_.socket_path.c_str());
            return BATTCTL_ERR_INVALID_STATE;
        }
        unlink(options_.socket_path.c_str());
    }

    const int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        BATTCTL_LOGE(TAG, "socket failed: %s", std::strerror(errno));
        return BATTCTL_FAIL;
    }

    if (bind(fd, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) != 0) {
        BATTCTL_LOGE(TAG, "bind %s failed: %s", options_.socket_path.c_str(), std::strerror(errno));
        close(fd);
        return BATTCTL_FAIL;
    }

    // Access control happens per connection in the validator.
    if (chmod(options_.socket_path.c_str(), 0666) != 0) {
        BATTCTL_LOGW(TAG, "chmod %s failed: %s", options_.socket_path.c_str(), std::strerror(errno));
    }

    if (listen(fd, options_.backlog) != 0) {
        BATTCTL_LOGE(TAG, "listen failed: %s", std::strerror(errno));
        close(fd);
        unlink(options_.socket_path.c_str());
        return BATTCTL_FAIL;
    }

    listen_fd_ = fd;
    stop_requested_.store(false, std::memory_order_release);
    state_.store(AgentState::Listening, std::memory_order_release);
    BATTCTL_LOGI(TAG, "Listening on %s", options_.socket_path.c_str());
    return BATTCTL_OK;
}

battctl_err_t AgentServer::run()
{
    if (listen_fd_ < 0) {
        return BATTCTL_ERR_INVALID_STATE;
    }

    while (!stop_requested_.load(std::memory_order_acquire)) {
        pollfd fds[2] = {
            {listen_fd_, POLLIN, 0},
            {wake_pipe_[0], POLLIN, 0},
        };

        const int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            BATTCTL_LOGE(TAG, "poll failed: %s", std::strerror(errno));
            break;
        }
        if (fds[1].revents != 0) {
            break;
        }
        if ((fds[0].revents & POLLIN) == 0) {
            continue;
        }

        const int client = accept(listen_fd_, nullptr, nullptr);
        if (client < 0) {
            if (errno != EINTR && errno != ECONNABORTED && errno != EAGAIN) {
                BATTCTL_LOGW(TAG, "accept failed: %s", std::strerror(errno));
            }
            continue;
        }
        serve_connection(client);
    }

    close_listener();
    state_.store(AgentState::Idle, std::memory_order_release);
    BATTCTL_LOGI(TAG, "Stopped");
    return BATTCTL_OK;
}

void AgentServer::stop()
{
    stop_requested_.store(true, std::memory_order_release);
    if (wake_pipe_[1] >= 0) {
        const char byte = 1;
        // A full pipe already guarantees a wake-up.
        const ssize_t written = write(wake_pipe_[1], &byte, 1);
        (void)written;
    }
}

void AgentServer::close_listener()
{
    if (listen_fd_ < 0) {
        return;
    }
    close(listen_fd_);
    listen_fd_ = -1;
    unlink(options_.socket_path.c_str());
}

// =============================================================================
// Connection handling
// =============================================================================

void AgentServer::serve_connection(int fd)
{
    state_.store(AgentState::Serving, std::memory_order_release);

    if (!validator_.validate(fd)) {
        connections_rejected_.fetch_add(1, std::memory_order_relaxed);
        close(fd);
        state_.store(AgentState::Listening, std::memory_order_release);
        return;
    }

    connections_accepted_.fetch_add(1, std::memory_order_relaxed);
    suppress_sigpipe(fd);
    serve_requests(fd);
    close(fd);
    state_.store(AgentState::Listening, std::memory_order_release);
}

void AgentServer::serve_requests(int fd)
{
    using Clock = std::chrono::steady_clock;

    LineBuffer buffer;
    char chunk[1024];
    // Each request must arrive in full within receive_timeout of the previous answer.
    auto deadline = Clock::now() + options_.receive_timeout;

    while (!stop_requested_.load(std::memory_order_acquire)) {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (remaining <= 0) {
            BATTCTL_LOGD(TAG, "Request not completed within %lld ms, closing",
                         static_cast<long long>(options_.receive_timeout.count()));
            return;
        }

        pollfd fds[2] = {
            {fd, POLLIN, 0},
            {wake_pipe_[0], POLLIN, 0},
        };

        const int ready = poll(fds, 2, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            BATTCTL_LOGW(TAG, "poll on client failed: %s", std::strerror(errno));
            return;
        }
        if (ready == 0) {
            continue;
        }
        if (fds[1].revents != 0) {
            return;
        }

        const ssize_t received = recv(fd, chunk, sizeof(chunk), 0);
        if (received == 0) {
            return;
        }
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            BATTCTL_LOGW(TAG, "recv failed: %s", std::strerror(errno));
            return;
        }

        if (buffer.append(chunk, static_cast<size_t>(received)) != BATTCTL_OK) {
            protocol_errors_.fetch_add(1, std::memory_order_relaxed);
            BATTCTL_LOGW(TAG, "Request exceeds %zu bytes, closing connection", constants::kMaxFrameLength);
            return;
        }

        while (auto line = buffer.next_line()) {
            if (line->empty()) {
                continue;
            }
            std::string reply;
            const ControlResponse response = process_line(*line);
            if (encode_response(response, reply) != BATTCTL_OK) {
                reply = "{\"success\":false,\"message\":\"Internal encoding error\"}\n";
            }
            if (!send_line(fd, reply)) {
                return;
            }
            deadline = Clock::now() + options_.receive_timeout;
        }
    }
}

ControlResponse AgentServer::process_line(const std::string &line)
{
    ControlRequest request;
    std::string error;
    if (decode_request(line, request, error) != BATTCTL_OK) {
        protocol_errors_.fetch_add(1, std::memory_order_relaxed);
        BATTCTL_LOGW(TAG, "Bad request: %s", error.c_str());
        return ControlResponse::error(error);
    }

    try {
        ControlResponse response = handler_.handle(request);
        requests_served_.fetch_add(1, std::memory_order_relaxed);
        if (!response.success) {
            request_errors_.fetch_add(1, std::memory_order_relaxed);
        }
        BATTCTL_LOGI(TAG, "%s -> %s", operation_name(request.operation), response.success ? "ok" : "failed");
        return response;
    } catch (const std::exception &e) {
        request_errors_.fetch_add(1, std::memory_order_relaxed);
        BATTCTL_LOGE(TAG, "%s raised: %s", operation_name(request.operation), e.what());
        return ControlResponse::error(std::string("Internal error: ") + e.what());
    }
}

bool AgentServer::send_line(int fd, const std::string &line)
{
    size_t sent = 0;
    while (sent < line.size()) {
        const ssize_t n = send(fd, line.data() + sent, line.size() - sent, kSendFlags);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            BATTCTL_LOGW(TAG, "send failed: %s", std::strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

AgentServer::Stats AgentServer::get_stats() const
{
    return Stats{
        connections_accepted_.load(std::memory_order_relaxed),
        connections_rejected_.load(std::memory_order_relaxed),
        requests_served_.load(std::memory_order_relaxed),
        request_errors_.load(std::memory_order_relaxed),
        protocol_errors_.load(std::memory_order_relaxed),
    };
}

} // namespace battctl
