/**
 * @file battery_control.hpp
 * @brief Charge limit, charge enable and battery telemetry over the SMC
 *
 * Writes are gated by the PrivilegeContext handed to the constructor; an
 * unprivileged facade answers RequiresElevatedPrivilege without touching any
 * register so that callers can replay the request through the agent.
 * Reads are best effort and return nullopt when the data is unavailable.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "control_result.hpp"
#include "privilege_context.hpp"
#include "register_map.hpp"

namespace battctl {

struct KeyReport {
    std::string key;
    std::string label;
    bool present{false};
    std::string value;
};

/**
 * @brief Read-only snapshot of what this machine supports
 */
struct DiagnosticReport {
    bool smc_connected{false};
    std::optional<HardwareVariant> variant;
    std::vector<KeyReport> keys;
    std::optional<int> charge_limit;
    std::optional<bool> charging_enabled;
    std::optional<double> temperature_c;
    std::optional<int> cycle_count;
    std::optional<int> battery_count;
    std::optional<bool> battery_powered;
    bool can_write{false};
};

class BatteryControl {
public:
    BatteryControl(RegisterMap &registers, PrivilegeContext privilege);

    ControlResult set_charge_limit(int percent);
    std::optional<int> get_charge_limit();

    ControlResult set_charging_enabled(bool enabled);
    std::optional<bool> is_charging_enabled();

    /// First battery sensor reporting a positive temperature, in Celsius
    std::optional<double> get_battery_temperature();

    std::optional<int> get_cycle_count();
    std::optional<int> get_battery_count();
    std::optional<bool> is_battery_powered();

    /// Catalog keys present on this machine
    std::vector<std::string> available_keys() { return registers_.list_available_keys(); }

    std::optional<HardwareVariant> hardware_variant() { return registers_.resolve_variant(); }
    const PrivilegeContext &privilege() const { return privilege_; }

    DiagnosticReport run_diagnostics();

private:
    void note_missing(RegisterKey key, battctl_err_t err);

    RegisterMap &registers_;
    PrivilegeContext privilege_;
};

std::string format_diagnostics_text(const DiagnosticReport &report);

/// nullopt only when the JSON tree cannot be allocated
std::optional<std::string> format_diagnostics_json(const DiagnosticReport &report);

} // namespace battctl
