/**
 * @file connection_validator.hpp
 * @brief Admission check for connections accepted by the agent
 */

#pragma once

#include <cstdint>
#include <optional>
#include <sys/types.h>
#include <vector>

#include "battctl_err.h"

namespace battctl {

struct PeerIdentity {
    uid_t uid{0};
    gid_t gid{0};
    std::optional<pid_t> pid;
};

/// Kernel-reported credentials of the process on the other end of a socket
battctl_err_t read_peer_identity(int fd, PeerIdentity &identity);

class ConnectionValidator {
public:
    virtual ~ConnectionValidator() = default;

    /// Must not read from or write to the socket
    virtual bool validate(int fd) = 0;
};

/**
 * @brief Admits root, the listed uids and members of one primary group
 */
class PeerCredentialValidator final : public ConnectionValidator {
public:
    PeerCredentialValidator(std::vector<uint32_t> allowed_uids, std::optional<uint32_t> allowed_gid);

    bool validate(int fd) override;

    bool is_allowed(const PeerIdentity &identity) const;

private:
    std::vector<uint32_t> allowed_uids_;
    std::optional<uint32_t> allowed_gid_;
};

} // namespace battctl
