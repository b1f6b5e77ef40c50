/**
 * @file agent_client.cpp
 * @brief AgentClient implementation
 */

#include "agent_client.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>

#include "battctl_log.h"

namespace battctl {

namespace {
const char *TAG = "agent_client";

#if defined(MSG_NOSIGNAL)
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

class ScopedFd {
public:
    explicit ScopedFd(int fd)
        : fd_(fd)
    {
    }
    ~ScopedFd()
    {
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    ScopedFd(const ScopedFd &) = delete;
    ScopedFd &operator=(const ScopedFd &) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

} // namespace

AgentClient::AgentClient(Options options)
    : options_(std::move(options))
{
}

battctl_err_t AgentClient::connect_socket(int &fd)
{
    sockaddr_un addr{};
    if (options_.socket_path.empty() || options_.socket_path.size() >= sizeof(addr.sun_path)) {
        return BATTCTL_ERR_INVALID_ARG;
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, options_.socket_path.c_str(), options_.socket_path.size() + 1);

    fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        BATTCTL_LOGE(TAG, "socket failed: %s", std::strerror(errno));
        return BATTCTL_FAIL;
    }

#if defined(SO_NOSIGPIPE)
    const int on = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &on, sizeof(on)) != 0) {
        BATTCTL_LOGD(TAG, "SO_NOSIGPIPE failed: %s", std::strerror(errno));
    }
#endif

    if (connect(fd, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) != 0) {
        const int saved = errno;
        close(fd);
        fd = -1;
        if (saved == ENOENT || saved == ECONNREFUSED) {
            BATTCTL_LOGD(TAG, "Agent not running at %s", options_.socket_path.c_str());
            return BATTCTL_ERR_AGENT_UNAVAILABLE;
        }
        if (saved == EACCES || saved == EPERM) {
            return BATTCTL_ERR_PERMISSION;
        }
        BATTCTL_LOGW(TAG, "connect %s failed: %s", options_.socket_path.c_str(), std::strerror(saved));
        return BATTCTL_FAIL;
    }
    return BATTCTL_OK;
}

battctl_err_t AgentClient::read_line(int fd, std::string &line)
{
    LineBuffer buffer;
    char chunk[1024];
    const int timeout_ms = static_cast<int>(options_.timeout.count());

    while (true) {
        pollfd pfd{fd, POLLIN, 0};
        const int ready = poll(&pfd, 1, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return BATTCTL_FAIL;
        }
        if (ready == 0) {
            BATTCTL_LOGW(TAG, "No reply within %d ms", timeout_ms);
            return BATTCTL_ERR_TIMEOUT;
        }

        const ssize_t received = recv(fd, chunk, sizeof(chunk), 0);
        if (received == 0) {
            // The agent closes without a reply when it rejects the peer.
            return BATTCTL_ERR_AUTH;
        }
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            return BATTCTL_FAIL;
        }

        if (buffer.append(chunk, static_cast<size_t>(received)) != BATTCTL_OK) {
            return BATTCTL_ERR_PROTOCOL;
        }
        if (auto complete = buffer.next_line()) {
            line = std::move(*complete);
            return BATTCTL_OK;
        }
    }
}

battctl_err_t AgentClient::send(const ControlRequest &request, ControlResponse &response)
{
    std::string outgoing;
    battctl_err_t err = encode_request(request, outgoing);
    if (err != BATTCTL_OK) {
        return err;
    }

    int raw_fd = -1;
    err = connect_socket(raw_fd);
    if (err != BATTCTL_OK) {
        return err;
    }
    ScopedFd fd(raw_fd);

    size_t sent = 0;
    while (sent < outgoing.size()) {
        const ssize_t n = ::send(fd.get(), outgoing.data() + sent, outgoing.size() - sent, kSendFlags);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            BATTCTL_LOGW(TAG, "send failed: %s", std::strerror(errno));
            return errno == EPIPE ? BATTCTL_ERR_AUTH : BATTCTL_FAIL;
        }
        sent += static_cast<size_t>(n);
    }

    std::string incoming;
    err = read_line(fd.get(), incoming);
    if (err != BATTCTL_OK) {
        return err;
    }
    return decode_response(incoming, request.operation, response);
}

ControlResult AgentClient::to_result(battctl_err_t err, const ControlResponse &response)
{
    if (err == BATTCTL_ERR_AGENT_UNAVAILABLE) {
        return ControlResult::agent_unavailable("Privileged agent is not running");
    }
    if (err != BATTCTL_OK) {
        return ControlResult::failed(std::string("Agent request failed: ") + battctl_err_to_name(err));
    }
    if (response.success) {
        return ControlResult::success(response.message.value_or(""));
    }
    std::string message = response.message.value_or("Agent reported failure");
    const auto status = response.status ? control_status_from_name(*response.status) : std::nullopt;
    if (status == ControlStatus::NotSupported) {
        return ControlResult::not_supported(std::move(message));
    }
    if (status == ControlStatus::RequiresElevatedPrivilege) {
        return ControlResult{ControlStatus::RequiresElevatedPrivilege, std::move(message)};
    }
    return ControlResult::failed(std::move(message));
}

ControlResult AgentClient::set_charge_limit(int percent)
{
    ControlResponse response;
    const battctl_err_t err = send(ControlRequest{Operation::SetChargeLimit, percent}, response);
    return to_result(err, response);
}

ControlResult AgentClient::set_charging_enabled(bool enabled)
{
    ControlResponse response;
    const battctl_err_t err = send(ControlRequest{Operation::SetChargingEnabled, enabled ? 1 : 0}, response);
    return to_result(err, response);
}

std::optional<StatusReply> AgentClient::get_status()
{
    ControlResponse response;
    if (send(ControlRequest{Operation::GetStatus, std::nullopt}, response) != BATTCTL_OK || !response.success) {
        return std::nullopt;
    }
    if (const auto *status = std::get_if<StatusReply>(&response.payload)) {
        return *status;
    }
    return std::nullopt;
}

std::optional<std::string> AgentClient::get_version()
{
    ControlResponse response;
    if (send(ControlRequest{Operation::GetVersion, std::nullopt}, response) != BATTCTL_OK || !response.success) {
        return std::nullopt;
    }
    if (const auto *version = std::get_if<VersionReply>(&response.payload)) {
        return version->version;
    }
    return std::nullopt;
}

std::optional<std::string> AgentClient::run_diagnostics()
{
    ControlResponse response;
    if (send(ControlRequest{Operation::RunDiagnostics, std::nullopt}, response) != BATTCTL_OK ||
        !response.success) {
        return std::nullopt;
    }
    if (const auto *report = std::get_if<DiagnosticsReply>(&response.payload)) {
        return report->report;
    }
    return std::nullopt;
}

} // namespace battctl
