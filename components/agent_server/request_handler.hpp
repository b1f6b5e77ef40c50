/**
 * @file request_handler.hpp
 * @brief Dispatch of validated agent requests
 */

#pragma once

#include "agent_protocol.hpp"
#include "battery_control.hpp"

namespace battctl {

class RequestHandler {
public:
    virtual ~RequestHandler() = default;
    virtual ControlResponse handle(const ControlRequest &request) = 0;
};

/**
 * @brief Executes requests against a privileged BatteryControl
 */
class BatteryRequestHandler final : public RequestHandler {
public:
    explicit BatteryRequestHandler(BatteryControl &control);

    ControlResponse handle(const ControlRequest &request) override;

private:
    ControlResponse status();
    ControlResponse diagnostics();

    BatteryControl &control_;
};

} // namespace battctl
