/**
 * @file battery_service.hpp
 * @brief Entry point used by the UI and the CLI
 *
 * Reads come from the power management service and the unprivileged facade.
 * Writes are attempted locally first; when the facade answers
 * RequiresElevatedPrivilege the same request is replayed through the agent.
 */

#pragma once

#include <chrono>
#include <optional>

#include "agent_client.hpp"
#include "battery_control.hpp"
#include "power_source_reader.hpp"
#include "timed_reader.hpp"

namespace battctl {

struct BatteryStatus {
    int charge_percent{0};
    bool is_charging{false};
    bool is_plugged_in{false};
    std::optional<double> temperature_c;
    std::optional<int> cycle_count;
    double health_ratio{0.0};
};

class BatteryService {
public:
    struct Options {
        std::chrono::milliseconds telemetry_timeout{2000};
        std::chrono::milliseconds telemetry_cache{300000};
        std::chrono::milliseconds temperature_cache{0};
    };

    BatteryService(BatteryControl &control, PowerSourceReader &power, AgentClient &agent, Options options);
    ~BatteryService();

    BatteryService(const BatteryService &) = delete;
    BatteryService &operator=(const BatteryService &) = delete;

    battctl_err_t get_battery_status(BatteryStatus &status);

    ControlResult request_charge_limit(int percent);
    ControlResult request_charging_enabled(bool enabled);

private:
    BatteryControl &control_;
    PowerSourceReader &power_;
    AgentClient &agent_;
    TimedReader<int> cycle_count_;
    TimedReader<double> temperature_;
};

} // namespace battctl
