/**
 * @file register_map.hpp
 * @brief Serialised register access and hardware variant detection
 *
 * RegisterMap is the only owner-side user of the SmcSession. Every primitive
 * connects the session on demand and holds the internal mutex for the whole
 * exchange, so concurrent callers never interleave key-info and read calls.
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "battctl_err.h"
#include "register_catalog.hpp"
#include "smc_session.hpp"

namespace battctl {

class RegisterMap {
public:
    explicit RegisterMap(SmcSession &session);

    RegisterMap(const RegisterMap &) = delete;
    RegisterMap &operator=(const RegisterMap &) = delete;

    /// Opens the session if needed
    bool connect();

    /// True only when a key-info lookup for the key succeeds
    bool probe_exists(RegisterKey key);

    battctl_err_t get_key_info(RegisterKey key, RegisterInfo &info);
    battctl_err_t read(RegisterKey key, RegisterValue &value);

    /**
     * @brief Writes an encoded value after checking the key's live metadata
     *
     * Refuses with BATTCTL_ERR_TYPE_MISMATCH or BATTCTL_ERR_INVALID_SIZE when
     * the controller declares a different type or size for the key.
     */
    battctl_err_t write(RegisterKey key, const RegisterValue &value);

    /**
     * @brief Determines the charge-limit generation of this machine
     *
     * BCLM wins over CHWA when both are present. A positive result is cached
     * until invalidate_variant().
     */
    std::optional<HardwareVariant> resolve_variant();
    void invalidate_variant();

    /// Names of catalog keys present on this machine, in catalog order
    std::vector<std::string> list_available_keys();

private:
    bool ensure_connected_locked();
    bool probe_exists_locked(RegisterKey key);

    SmcSession &session_;
    std::mutex mutex_;
    std::optional<HardwareVariant> cached_variant_;
};

} // namespace battctl
