/**
 * @file agent_config.hpp
 * @brief Agent configuration file with validation
 *
 * The configuration is a JSON object; every key is optional:
 *
 *     {
 *       "socket_path": "/var/run/battctl.sock",
 *       "allowed_uids": [501],
 *       "allowed_gid": 80,
 *       "request_timeout_ms": 5000,
 *       "telemetry_timeout_ms": 2000,
 *       "telemetry_cache_ms": 300000,
 *       "log_level": "info",
 *       "log_to_stderr": false
 *     }
 *
 * A file that fails to parse or validate leaves the current configuration
 * untouched.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "battctl_err.h"

namespace battctl {

// =============================================================================
// Configuration Constants
// =============================================================================

namespace constants {
constexpr std::string_view kDefaultSocketPath = "/var/run/battctl.sock";
constexpr std::string_view kDefaultConfigPath = "/Library/Application Support/battctl/agent.json";
constexpr size_t kMaxConfigFileSize = 64 * 1024;

constexpr uint32_t kRequestTimeoutMinMs = 100;
constexpr uint32_t kRequestTimeoutMaxMs = 60000;
constexpr uint32_t kRequestTimeoutDefaultMs = 5000;

constexpr uint32_t kTelemetryTimeoutMinMs = 100;
constexpr uint32_t kTelemetryTimeoutMaxMs = 30000;
constexpr uint32_t kTelemetryTimeoutDefaultMs = 2000;

constexpr uint32_t kTelemetryCacheMaxMs = 3600000;
constexpr uint32_t kTelemetryCacheDefaultMs = 300000;
} // namespace constants

struct AgentConfig {
    std::string socket_path;
    std::vector<uint32_t> allowed_uids;
    std::optional<uint32_t> allowed_gid;
    uint32_t request_timeout_ms{constants::kRequestTimeoutDefaultMs};
    uint32_t telemetry_timeout_ms{constants::kTelemetryTimeoutDefaultMs};
    uint32_t telemetry_cache_ms{constants::kTelemetryCacheDefaultMs};
    std::string log_level;
    bool log_to_stderr{false};
};

// =============================================================================
// Configuration Validator
// =============================================================================

class Validator {
public:
    struct ValidationResult {
        bool valid;
        std::string error_message;

        explicit operator bool() const { return valid; }
    };

    static ValidationResult validate(const AgentConfig &cfg);

private:
    static bool is_valid_uint32_range(uint32_t value, uint32_t min, uint32_t max);
    static bool is_valid_socket_path(std::string_view path);
    static bool is_known_log_level(std::string_view level);
};

// =============================================================================
// Configuration Manager
// =============================================================================

class ConfigManager {
public:
    struct Stats {
        uint32_t loads;
        uint32_t parse_failures;
        uint32_t validation_failures;
    };

    ConfigManager();

    ConfigManager(const ConfigManager &) = delete;
    ConfigManager &operator=(const ConfigManager &) = delete;

    /// A missing file keeps the defaults and is not an error
    battctl_err_t load_file(const std::string &path);
    battctl_err_t load_from_string(std::string_view json);

    AgentConfig get() const;

    std::string get_socket_path() const;
    uint32_t get_request_timeout_ms() const;
    uint32_t get_telemetry_timeout_ms() const;
    uint32_t get_telemetry_cache_ms() const;

    /// Message of the last rejected file, empty when none
    std::string last_error() const;

    Stats get_stats() const;

    static AgentConfig defaults();

private:
    battctl_err_t reject(std::string message, std::atomic<uint32_t> &counter);

    mutable std::mutex mutex_;
    AgentConfig config_;
    std::string last_error_;
    std::atomic<uint32_t> loads_{0};
    std::atomic<uint32_t> parse_failures_{0};
    std::atomic<uint32_t> validation_failures_{0};
};

} // namespace battctl
