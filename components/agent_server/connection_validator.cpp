/**
 * @file connection_validator.cpp
 * @brief Peer credential lookup and allow-list check
 */

#include "connection_validator.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>

#include "battctl_log.h"

namespace battctl {

namespace {
const char *TAG = "agent_auth";
} // namespace

battctl_err_t read_peer_identity(int fd, PeerIdentity &identity)
{
#if defined(__APPLE__)
    uid_t uid = 0;
    gid_t gid = 0;
    if (getpeereid(fd, &uid, &gid) != 0) {
        BATTCTL_LOGW(TAG, "getpeereid failed: %s", std::strerror(errno));
        return BATTCTL_ERR_AUTH;
    }
    identity.uid = uid;
    identity.gid = gid;

    pid_t pid = 0;
    socklen_t pid_len = sizeof(pid);
    if (getsockopt(fd, SOL_LOCAL, LOCAL_PEERPID, &pid, &pid_len) == 0) {
        identity.pid = pid;
    } else {
        identity.pid.reset();
    }
#else
    struct ucred cred {};
    socklen_t cred_len = sizeof(cred);
    if (getsockopt(fd, SOL_SOCKET, SO_PEERCRED, &cred, &cred_len) != 0) {
        BATTCTL_LOGW(TAG, "SO_PEERCRED failed: %s", std::strerror(errno));
        return BATTCTL_ERR_AUTH;
    }
    identity.uid = cred.uid;
    identity.gid = cred.gid;
    identity.pid = cred.pid;
#endif
    return BATTCTL_OK;
}

PeerCredentialValidator::PeerCredentialValidator(std::vector<uint32_t> allowed_uids,
                                                 std::optional<uint32_t> allowed_gid)
    : allowed_uids_(std::move(allowed_uids))
    , allowed_gid_(allowed_gid)
{
}

bool PeerCredentialValidator::is_allowed(const PeerIdentity &identity) const
{
    if (identity.uid == 0) {
        return true;
    }
    if (std::find(allowed_uids_.begin(), allowed_uids_.end(), identity.uid) != allowed_uids_.end()) {
        return true;
    }
    return allowed_gid_ && identity.gid == *allowed_gid_;
}

bool PeerCredentialValidator::validate(int fd)
{
    PeerIdentity identity;
    if (read_peer_identity(fd, identity) != BATTCTL_OK) {
        return false;
    }

    const bool allowed = is_allowed(identity);
    if (!allowed) {
        BATTCTL_LOGW(TAG, "Rejected peer uid=%u gid=%u pid=%d", static_cast<unsigned>(identity.uid),
                     static_cast<unsigned>(identity.gid), identity.pid.value_or(-1));
    } else {
        BATTCTL_LOGD(TAG, "Accepted peer uid=%u pid=%d", static_cast<unsigned>(identity.uid),
                     identity.pid.value_or(-1));
    }
    return allowed;
}

} // namespace battctl
