/**
 * @file smc_session.hpp
 * @brief Connection to the system management controller
 *
 * SmcSession owns the Disconnected -> Connected -> Disconnected life cycle and
 * the translation of raw call outcomes into battctl_err_t. The transport
 * itself (IOKit on macOS, an in-memory table in tests) is supplied by
 * subclasses through do_call().
 *
 * A session is not thread-safe; RegisterMap serialises access to it.
 * Calls are never retried here.
 */

#pragma once

#include <atomic>
#include <cstdint>

#include "battctl_err.h"
#include "smc_protocol.h"
#include "smc_types.hpp"

namespace battctl {

enum class SmcCommand : uint8_t {
    ReadKey = SMC_CMD_READ_KEY,
    WriteKey = SMC_CMD_WRITE_KEY,
    GetKeyCount = SMC_CMD_GET_KEY_COUNT,
    GetKeyFromIndex = SMC_CMD_GET_KEY_FROM_INDEX,
    GetKeyInfo = SMC_CMD_GET_KEY_INFO,
};

const char *smc_command_name(SmcCommand command);

/**
 * @brief Outcome of one exchange
 *
 * os_status carries the kern_return_t of a failed transport call, or the SMC
 * result byte when the controller itself rejected the request.
 */
struct CallStatus {
    battctl_err_t err{BATTCTL_OK};
    uint32_t os_status{0};

    explicit operator bool() const { return err == BATTCTL_OK; }
};

class SmcSession {
public:
    struct Stats {
        uint32_t calls;
        uint32_t failures;
        uint32_t not_found;
    };

    virtual ~SmcSession() = default;

    /// Idempotent. Returns false when the service cannot be found or opened.
    virtual bool connect() = 0;

    /// Idempotent. Safe on a session that never connected.
    virtual void disconnect() = 0;

    virtual bool is_connected() const = 0;

    /**
     * @brief Performs one structured exchange
     *
     * The command is written into input.data8. Fails with
     * BATTCTL_ERR_NOT_OPEN while disconnected.
     */
    CallStatus call(SmcCommand command, smc_param_struct_t &input, smc_param_struct_t &output);

    CallStatus read_key_info(RegisterKey key, RegisterInfo &info);

    /// Key info lookup followed by a read sized by the reported data size
    CallStatus read_key(RegisterKey key, RegisterValue &value);

    CallStatus write_key(RegisterKey key, const RegisterValue &value);

    Stats get_stats() const;

protected:
    SmcSession() = default;

    /// Transport hook. Must not interpret output.result.
    virtual CallStatus do_call(const smc_param_struct_t &input, smc_param_struct_t &output) = 0;

private:
    std::atomic<uint32_t> calls_{0};
    std::atomic<uint32_t> failures_{0};
    std::atomic<uint32_t> not_found_{0};
};

} // namespace battctl
