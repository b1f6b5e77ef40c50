/**
 * @file privilege_context.hpp
 * @brief Explicit capability to write SMC registers
 */

#pragma once

#include <unistd.h>

namespace battctl {

class PrivilegeContext {
public:
    /// Reads the effective user id once; root may write
    static PrivilegeContext from_process() { return PrivilegeContext(geteuid() == 0); }

    static PrivilegeContext elevated() { return PrivilegeContext(true); }
    static PrivilegeContext unprivileged() { return PrivilegeContext(false); }

    bool can_write() const { return can_write_; }

private:
    explicit PrivilegeContext(bool can_write)
        : can_write_(can_write)
    {
    }

    bool can_write_;
};

} // namespace battctl
