/**
 * @file battctl_main.cpp
 * @brief Command line front end
 *
 *   battctl status
 *   battctl diagnostics [--json]
 *   battctl set-limit <20-100>
 *   battctl set-charging <on|off>
 *   battctl agent-version
 *
 * Global options: --socket PATH, --verbose
 *
 * Exit status: 0 success, 1 failure, 2 usage error, 3 agent not running.
 */

#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#include "agent_client.hpp"
#include "agent_config.hpp"
#include "battctl_log.h"
#include "battery_service.hpp"
#include "iokit_smc_session.hpp"
#include "iops_power_source_reader.hpp"

namespace {

constexpr int kExitUsage = 2;
constexpr int kExitAgentUnavailable = 3;

void print_usage()
{
    std::fprintf(stderr,
                 "Usage: battctl [--socket PATH] [--verbose] <command>\n"
                 "\n"
                 "Commands:\n"
                 "  status                  Battery state and charge settings\n"
                 "  diagnostics [--json]    Supported registers and current readings\n"
                 "  set-limit <20-100>      Stop charging at the given percentage\n"
                 "  set-charging <on|off>   Allow or inhibit charging\n"
                 "  agent-version           Version of the running agent\n");
}

bool parse_int(std::string_view text, int &out)
{
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

int report(const battctl::ControlResult &result)
{
    std::printf("%s\n", result.message.empty() ? battctl::control_status_name(result.status) : result.message.c_str());
    switch (result.status) {
        case battctl::ControlStatus::Success:
            return EXIT_SUCCESS;
        case battctl::ControlStatus::AgentUnavailable:
            std::fprintf(stderr, "Install or start the battctld agent to change charge settings.\n");
            return kExitAgentUnavailable;
        default:
            return EXIT_FAILURE;
    }
}

int cmd_status(battctl::BatteryService &service, battctl::BatteryControl &control)
{
    battctl::BatteryStatus status;
    const battctl_err_t err = service.get_battery_status(status);
    if (err != BATTCTL_OK) {
        std::fprintf(stderr, "Battery status unavailable: %s\n", battctl_err_to_name(err));
        return EXIT_FAILURE;
    }

    std::printf("Charge:        %d%%\n", status.charge_percent);
    std::printf("Power:         %s%s\n", status.is_plugged_in ? "AC" : "battery",
                status.is_charging ? ", charging" : "");
    std::printf("Health:        %.0f%%\n", status.health_ratio * 100.0);
    if (status.temperature_c) {
        std::printf("Temperature:   %.1f C\n", *status.temperature_c);
    }
    if (status.cycle_count) {
        std::printf("Cycle count:   %d\n", *status.cycle_count);
    }

    if (const auto limit = control.get_charge_limit()) {
        std::printf("Charge limit:  %d%%\n", *limit);
    }
    if (const auto enabled = control.is_charging_enabled()) {
        std::printf("Charging:      %s\n", *enabled ? "allowed" : "inhibited");
    }
    return EXIT_SUCCESS;
}

int cmd_diagnostics(battctl::BatteryControl &control, bool json)
{
    const battctl::DiagnosticReport diagnostic = control.run_diagnostics();
    if (json) {
        const auto text = battctl::format_diagnostics_json(diagnostic);
        if (!text) {
            std::fprintf(stderr, "Out of memory\n");
            return EXIT_FAILURE;
        }
        std::printf("%s\n", text->c_str());
    } else {
        std::fputs(battctl::format_diagnostics_text(diagnostic).c_str(), stdout);
    }
    return diagnostic.smc_connected ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace

int main(int argc, char **argv)
{
    std::string socket_path(battctl::constants::kDefaultSocketPath);
    bool verbose = false;
    std::vector<std::string_view> args;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--socket" && i + 1 < argc) {
            socket_path = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return EXIT_SUCCESS;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage();
        return kExitUsage;
    }

    battctl_log_init("battctl", verbose);
    battctl_log_set_level(verbose ? BATTCTL_LOG_DEBUG : BATTCTL_LOG_WARN);

    battctl::IokitSmcSession session;
    battctl::RegisterMap registers(session);
    battctl::BatteryControl control(registers, battctl::PrivilegeContext::from_process());
    battctl::IopsPowerSourceReader power;
    battctl::AgentClient agent(battctl::AgentClient::Options{
        socket_path, std::chrono::milliseconds(battctl::constants::kRequestTimeoutDefaultMs)});
    battctl::BatteryService service(control, power, agent,
                                    battctl::BatteryService::Options{
                                        std::chrono::milliseconds(battctl::constants::kTelemetryTimeoutDefaultMs),
                                        std::chrono::milliseconds(battctl::constants::kTelemetryCacheDefaultMs)});

    const std::string_view command = args[0];

    if (command == "status" && args.size() == 1) {
        return cmd_status(service, control);
    }

    if (command == "diagnostics" && args.size() <= 2) {
        const bool json = args.size() == 2 && args[1] == "--json";
        if (args.size() == 2 && !json) {
            print_usage();
            return kExitUsage;
        }
        return cmd_diagnostics(control, json);
    }

    if (command == "set-limit" && args.size() == 2) {
        int percent = 0;
        if (!parse_int(args[1], percent)) {
            std::fprintf(stderr, "Invalid percentage '%.*s'\n", static_cast<int>(args[1].size()), args[1].data());
            return kExitUsage;
        }
        return report(service.request_charge_limit(percent));
    }

    if (command == "set-charging" && args.size() == 2) {
        if (args[1] != "on" && args[1] != "off") {
            print_usage();
            return kExitUsage;
        }
        return report(service.request_charging_enabled(args[1] == "on"));
    }

    if (command == "agent-version" && args.size() == 1) {
        const auto version = agent.get_version();
        if (!version) {
            std::fprintf(stderr, "Agent not reachable at %s\n", socket_path.c_str());
            return kExitAgentUnavailable;
        }
        std::printf("%s\n", version->c_str());
        return EXIT_SUCCESS;
    }

    print_usage();
    return kExitUsage;
}
