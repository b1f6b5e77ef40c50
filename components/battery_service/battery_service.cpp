/**
 * @file battery_service.cpp
 * @brief BatteryService implementation
 */

#include "battery_service.hpp"

#include <algorithm>

#include "battctl_log.h"

namespace battctl {

namespace {
const char *TAG = "battery_service";
} // namespace

BatteryService::BatteryService(BatteryControl &control, PowerSourceReader &power, AgentClient &agent,
                               Options options)
    : control_(control)
    , power_(power)
    , agent_(agent)
    , cycle_count_([&control] { return control.get_cycle_count(); }, options.telemetry_timeout,
                   options.telemetry_cache)
    , temperature_([&control] { return control.get_battery_temperature(); }, options.telemetry_timeout,
                   options.temperature_cache)
{
}

// The refresh workers read through control_, which must outlive them.
BatteryService::~BatteryService()
{
    cycle_count_.wait_idle();
    temperature_.wait_idle();
}

battctl_err_t BatteryService::get_battery_status(BatteryStatus &status)
{
    PowerSourceSnapshot snapshot;
    const battctl_err_t err = power_.read(snapshot);
    if (err != BATTCTL_OK) {
        BATTCTL_LOGW(TAG, "Power source unavailable: %s", battctl_err_to_name(err));
        return err;
    }

    BatteryStatus result;
    result.charge_percent = std::clamp(snapshot.current_capacity, 0, 100);
    result.is_charging = snapshot.is_charging;
    result.is_plugged_in = snapshot.is_plugged_in;
    result.health_ratio = snapshot.max_capacity > 0 ? static_cast<double>(snapshot.max_capacity) / 100.0 : 0.0;
    result.temperature_c = temperature_.get();
    result.cycle_count = cycle_count_.get();

    status = result;
    return BATTCTL_OK;
}

ControlResult BatteryService::request_charge_limit(int percent)
{
    ControlResult result = control_.set_charge_limit(percent);
    if (result.status != ControlStatus::RequiresElevatedPrivilege) {
        return result;
    }

    BATTCTL_LOGI(TAG, "Routing charge limit %d%% through the agent", percent);
    return agent_.set_charge_limit(percent);
}

ControlResult BatteryService::request_charging_enabled(bool enabled)
{
    ControlResult result = control_.set_charging_enabled(enabled);
    if (result.status != ControlStatus::RequiresElevatedPrivilege) {
        return result;
    }

    BATTCTL_LOGI(TAG, "Routing charging %s through the agent", enabled ? "enable" : "disable");
    return agent_.set_charging_enabled(enabled);
}

} // namespace battctl
