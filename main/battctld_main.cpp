/**
 * @file battctld_main.cpp
 * @brief Privileged agent daemon, started by launchd as root
 *
 * Usage: battctld [--config PATH] [--foreground]
 */

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <unistd.h>

#include "agent_config.hpp"
#include "agent_server.hpp"
#include "battctl_log.h"
#include "battery_control.hpp"
#include "connection_validator.hpp"
#include "iokit_smc_session.hpp"
#include "register_map.hpp"
#include "request_handler.hpp"

static const char *TAG = "battctld";

static battctl::AgentServer *s_server = nullptr;

static void handle_termination(int)
{
    if (s_server != nullptr) {
        s_server->stop();
    }
}

static bool install_signal_handlers()
{
    struct sigaction action {};
    action.sa_handler = handle_termination;
    sigemptyset(&action.sa_mask);
    if (sigaction(SIGTERM, &action, nullptr) != 0 || sigaction(SIGINT, &action, nullptr) != 0) {
        return false;
    }

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    return sigaction(SIGPIPE, &ignore, nullptr) == 0;
}

static void print_usage(const char *program)
{
    std::fprintf(stderr, "Usage: %s [--config PATH] [--foreground]\n", program);
}

int main(int argc, char **argv)
{
    std::string config_path(battctl::constants::kDefaultConfigPath);
    bool foreground = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--foreground") == 0) {
            foreground = true;
        } else {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    battctl_log_init("battctld", foreground);

    battctl::ConfigManager config;
    if (config.load_file(config_path) != BATTCTL_OK) {
        BATTCTL_LOGE(TAG, "Invalid configuration %s: %s", config_path.c_str(), config.last_error().c_str());
        return EXIT_FAILURE;
    }
    const battctl::AgentConfig cfg = config.get();

    battctl_log_level_t level = BATTCTL_LOG_INFO;
    if (battctl_log_level_from_name(cfg.log_level.c_str(), &level)) {
        battctl_log_set_level(level);
    }
    if (cfg.log_to_stderr && !foreground) {
        battctl_log_init("battctld", true);
    }

    const battctl::PrivilegeContext privilege = battctl::PrivilegeContext::from_process();
    if (!privilege.can_write()) {
        BATTCTL_LOGW(TAG, "Not running as root, write requests will be refused");
    }

    battctl::IokitSmcSession session;
    battctl::RegisterMap registers(session);
    battctl::BatteryControl control(registers, privilege);
    battctl::BatteryRequestHandler handler(control);
    battctl::PeerCredentialValidator validator(cfg.allowed_uids, cfg.allowed_gid);

    battctl::AgentServer::Options options;
    options.socket_path = cfg.socket_path;
    options.receive_timeout = std::chrono::milliseconds(cfg.request_timeout_ms);
    battctl::AgentServer server(options, validator, handler);

    if (!registers.connect()) {
        BATTCTL_LOGW(TAG, "SMC not reachable yet, will retry per request");
    }

    const battctl_err_t err = server.start();
    if (err != BATTCTL_OK) {
        BATTCTL_LOGE(TAG, "Cannot start agent: %s", battctl_err_to_name(err));
        return EXIT_FAILURE;
    }

    s_server = &server;
    if (!install_signal_handlers()) {
        BATTCTL_LOGE(TAG, "sigaction failed: %s", std::strerror(errno));
        s_server = nullptr;
        return EXIT_FAILURE;
    }

    BATTCTL_LOGI(TAG, "Agent %s ready (pid %d)", std::string(battctl::constants::kAgentVersion).c_str(),
                 static_cast<int>(getpid()));
    const battctl_err_t run_err = server.run();
    s_server = nullptr;

    const auto stats = server.get_stats();
    BATTCTL_LOGI(TAG, "Served %u requests (%u failed), %u connections rejected", stats.requests_served,
                 stats.request_errors, stats.connections_rejected);
    return run_err == BATTCTL_OK ? EXIT_SUCCESS : EXIT_FAILURE;
}
