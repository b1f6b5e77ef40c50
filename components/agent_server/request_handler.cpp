/**
 * @file request_handler.cpp
 * @brief BatteryRequestHandler implementation
 */

#include "request_handler.hpp"

#include "battctl_log.h"

namespace battctl {

namespace {
const char *TAG = "agent_handler";

ControlResponse from_result(const ControlResult &result)
{
    if (result) {
        return ControlResponse::ok(result.message);
    }
    return ControlResponse::error(result.message, control_status_name(result.status));
}

} // namespace

BatteryRequestHandler::BatteryRequestHandler(BatteryControl &control)
    : control_(control)
{
}

ControlResponse BatteryRequestHandler::handle(const ControlRequest &request)
{
    BATTCTL_LOGD(TAG, "Handling %s", operation_name(request.operation));

    switch (request.operation) {
        case Operation::SetChargeLimit:
            if (!request.value) {
                return ControlResponse::error("Missing value");
            }
            return from_result(control_.set_charge_limit(*request.value));

        case Operation::SetChargingEnabled:
            if (!request.value) {
                return ControlResponse::error("Missing value");
            }
            return from_result(control_.set_charging_enabled(*request.value != 0));

        case Operation::GetStatus:
            return status();

        case Operation::GetVersion: {
            ControlResponse response{true, std::nullopt, VersionReply{std::string(constants::kAgentVersion)}};
            return response;
        }

        case Operation::RunDiagnostics:
            return diagnostics();
    }

    return ControlResponse::error("Unsupported operation");
}

ControlResponse BatteryRequestHandler::status()
{
    StatusReply reply;
    reply.charge_limit = control_.get_charge_limit();
    reply.charging_enabled = control_.is_charging_enabled();
    reply.temperature = control_.get_battery_temperature();
    reply.available_keys = control_.available_keys();
    return ControlResponse{true, std::nullopt, std::move(reply)};
}

ControlResponse BatteryRequestHandler::diagnostics()
{
    const DiagnosticReport report = control_.run_diagnostics();
    auto json = format_diagnostics_json(report);
    if (!json) {
        return ControlResponse::error("Out of memory while building diagnostics");
    }
    return ControlResponse{true, std::nullopt, DiagnosticsReply{std::move(*json)}};
}

} // namespace battctl
