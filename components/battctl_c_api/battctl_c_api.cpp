/**
 * @file battctl_c_api.cpp
 * @brief C wrappers over a process wide BatteryService
 */

#include "battctl_c_api.h"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>

#include "agent_config.hpp"
#include "battctl_log.h"
#include "battery_service.hpp"
#include "iokit_smc_session.hpp"
#include "iops_power_source_reader.hpp"

namespace {

const char *TAG = "battctl_c_api";

struct ServiceContext {
    explicit ServiceContext(const std::string &socket_path)
        : registers(session)
        , control(registers, battctl::PrivilegeContext::from_process())
        , agent(battctl::AgentClient::Options{socket_path, std::chrono::milliseconds(
                                                                 battctl::constants::kRequestTimeoutDefaultMs)})
        , service(control, power, agent,
                  battctl::BatteryService::Options{
                      std::chrono::milliseconds(battctl::constants::kTelemetryTimeoutDefaultMs),
                      std::chrono::milliseconds(battctl::constants::kTelemetryCacheDefaultMs)})
    {
    }

    battctl::IokitSmcSession session;
    battctl::RegisterMap registers;
    battctl::BatteryControl control;
    battctl::IopsPowerSourceReader power;
    battctl::AgentClient agent;
    battctl::BatteryService service;
};

// Guards the pointer only; each call works on its own reference.
std::mutex s_mutex;
std::shared_ptr<ServiceContext> s_context;

std::shared_ptr<ServiceContext> acquire_context()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_context;
}

battctl_control_status_t to_c_status(battctl::ControlStatus status)
{
    switch (status) {
        case battctl::ControlStatus::Success:
            return BATTCTL_CONTROL_SUCCESS;
        case battctl::ControlStatus::RequiresElevatedPrivilege:
            return BATTCTL_CONTROL_REQUIRES_ELEVATED_PRIVILEGE;
        case battctl::ControlStatus::NotSupported:
            return BATTCTL_CONTROL_NOT_SUPPORTED;
        case battctl::ControlStatus::AgentUnavailable:
            return BATTCTL_CONTROL_AGENT_UNAVAILABLE;
        case battctl::ControlStatus::Failed:
            break;
    }
    return BATTCTL_CONTROL_FAILED;
}

void copy_message(const std::string &text, char *message, size_t message_len)
{
    if (message == nullptr || message_len == 0) {
        return;
    }
    const size_t count = std::min(text.size(), message_len - 1);
    std::memcpy(message, text.data(), count);
    message[count] = '\0';
}

battctl_control_status_t finish(const battctl::ControlResult &result, char *message, size_t message_len)
{
    copy_message(result.message, message, message_len);
    return to_c_status(result.status);
}

} // namespace

extern "C" {

battctl_err_t battctl_init(const char *socket_path)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_context) {
        return BATTCTL_OK;
    }

    const std::string path = socket_path != nullptr ? socket_path : std::string(battctl::constants::kDefaultSocketPath);
    s_context = std::make_shared<ServiceContext>(path);
    BATTCTL_LOGI(TAG, "Initialised (agent socket %s)", path.c_str());
    return BATTCTL_OK;
}

void battctl_deinit(void)
{
    std::shared_ptr<ServiceContext> released;
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        released.swap(s_context);
    }
    // Freed here, or by the last call still using it.
}

battctl_err_t battctl_get_battery_status(battctl_battery_status_t *out_status)
{
    if (out_status == nullptr) {
        return BATTCTL_ERR_INVALID_ARG;
    }

    const auto context = acquire_context();
    if (!context) {
        return BATTCTL_ERR_INVALID_STATE;
    }

    battctl::BatteryStatus status;
    const battctl_err_t err = context->service.get_battery_status(status);
    if (err != BATTCTL_OK) {
        return err;
    }

    out_status->charge_percent = status.charge_percent;
    out_status->is_charging = status.is_charging;
    out_status->is_plugged_in = status.is_plugged_in;
    out_status->has_temperature = status.temperature_c.has_value();
    out_status->temperature_c = status.temperature_c.value_or(0.0);
    out_status->has_cycle_count = status.cycle_count.has_value();
    out_status->cycle_count = status.cycle_count.value_or(0);
    out_status->health_ratio = status.health_ratio;
    return BATTCTL_OK;
}

bool battctl_get_charge_limit(int *out_percent)
{
    if (out_percent == nullptr) {
        return false;
    }

    const auto context = acquire_context();
    if (!context) {
        return false;
    }

    const auto limit = context->control.get_charge_limit();
    if (!limit) {
        return false;
    }
    *out_percent = *limit;
    return true;
}

battctl_control_status_t battctl_request_charge_limit(int percent, char *message, size_t message_len)
{
    const auto context = acquire_context();
    if (!context) {
        copy_message("Not initialised", message, message_len);
        return BATTCTL_CONTROL_FAILED;
    }
    return finish(context->service.request_charge_limit(percent), message, message_len);
}

battctl_control_status_t battctl_request_charging_enabled(bool enabled, char *message, size_t message_len)
{
    const auto context = acquire_context();
    if (!context) {
        copy_message("Not initialised", message, message_len);
        return BATTCTL_CONTROL_FAILED;
    }
    return finish(context->service.request_charging_enabled(enabled), message, message_len);
}

} // extern "C"
