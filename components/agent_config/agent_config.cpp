/**
 * @file agent_config.cpp
 * @brief JSON configuration loading and validation
 */

#include "agent_config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <sys/un.h>

#include "battctl_log.h"
#include "cjson_utils.hpp"

namespace battctl {

namespace {
const char *TAG = "agent_config";

bool is_printable_ascii(std::string_view str)
{
    return std::all_of(str.begin(), str.end(), [](char c) { return std::isprint(static_cast<unsigned char>(c)); });
}

enum class FieldResult {
    Absent,
    Ok,
    WrongType,
};

FieldResult read_uint32(const cJSON *root, const char *name, uint32_t &out)
{
    const cJSON *item = cJSON_GetObjectItemCaseSensitive(root, name);
    if (item == nullptr) {
        return FieldResult::Absent;
    }
    if (!cJSON_IsNumber(item)) {
        return FieldResult::WrongType;
    }
    const double number = item->valuedouble;
    if (number < 0 || number > std::numeric_limits<uint32_t>::max() || std::floor(number) != number) {
        return FieldResult::WrongType;
    }
    out = static_cast<uint32_t>(number);
    return FieldResult::Ok;
}

FieldResult read_string(const cJSON *root, const char *name, std::string &out)
{
    const cJSON *item = cJSON_GetObjectItemCaseSensitive(root, name);
    if (item == nullptr) {
        return FieldResult::Absent;
    }
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        return FieldResult::WrongType;
    }
    out = item->valuestring;
    return FieldResult::Ok;
}

FieldResult read_bool(const cJSON *root, const char *name, bool &out)
{
    const cJSON *item = cJSON_GetObjectItemCaseSensitive(root, name);
    if (item == nullptr) {
        return FieldResult::Absent;
    }
    if (!cJSON_IsBool(item)) {
        return FieldResult::WrongType;
    }
    out = cJSON_IsTrue(item);
    return FieldResult::Ok;
}

FieldResult read_uid_list(const cJSON *root, const char *name, std::vector<uint32_t> &out)
{
    const cJSON *array = cJSON_GetObjectItemCaseSensitive(root, name);
    if (array == nullptr) {
        return FieldResult::Absent;
    }
    if (!cJSON_IsArray(array)) {
        return FieldResult::WrongType;
    }

    std::vector<uint32_t> uids;
    const cJSON *item = nullptr;
    cJSON_ArrayForEach(item, array)
    {
        if (!cJSON_IsNumber(item) || item->valuedouble < 0 ||
            item->valuedouble > std::numeric_limits<uint32_t>::max() ||
            std::floor(item->valuedouble) != item->valuedouble) {
            return FieldResult::WrongType;
        }
        uids.push_back(static_cast<uint32_t>(item->valuedouble));
    }
    out = std::move(uids);
    return FieldResult::Ok;
}

} // anonymous namespace

// =============================================================================
// Validator Implementation
// =============================================================================

Validator::ValidationResult Validator::validate(const AgentConfig &cfg)
{
    ValidationResult result{true, ""};

    if (!is_valid_socket_path(cfg.socket_path)) {
        result.valid = false;
        result.error_message = "socket_path must be an absolute path that fits a Unix socket address";
        return result;
    }

    if (!is_valid_uint32_range(cfg.request_timeout_ms,
                               constants::kRequestTimeoutMinMs,
                               constants::kRequestTimeoutMaxMs)) {
        result.valid = false;
        result.error_message = "request_timeout_ms out of range";
        return result;
    }

    if (!is_valid_uint32_range(cfg.telemetry_timeout_ms,
                               constants::kTelemetryTimeoutMinMs,
                               constants::kTelemetryTimeoutMaxMs)) {
        result.valid = false;
        result.error_message = "telemetry_timeout_ms out of range";
        return result;
    }

    if (!is_valid_uint32_range(cfg.telemetry_cache_ms, 0, constants::kTelemetryCacheMaxMs)) {
        result.valid = false;
        result.error_message = "telemetry_cache_ms out of range";
        return result;
    }

    if (!is_known_log_level(cfg.log_level)) {
        result.valid = false;
        result.error_message = "log_level must be one of none, error, warn, info, debug";
        return result;
    }

    return result;
}

bool Validator::is_valid_uint32_range(uint32_t value, uint32_t min, uint32_t max)
{
    return value >= min && value <= max;
}

bool Validator::is_valid_socket_path(std::string_view path)
{
    constexpr size_t kSunPathSize = sizeof(sockaddr_un{}.sun_path);
    if (path.empty() || path.front() != '/' || path.size() >= kSunPathSize) {
        return false;
    }
    return is_printable_ascii(path);
}

bool Validator::is_known_log_level(std::string_view level)
{
    battctl_log_level_t parsed;
    return battctl_log_level_from_name(std::string(level).c_str(), &parsed);
}

// =============================================================================
// ConfigManager Implementation
// =============================================================================

AgentConfig ConfigManager::defaults()
{
    AgentConfig cfg;
    cfg.socket_path = std::string(constants::kDefaultSocketPath);
    cfg.log_level = "info";
    return cfg;
}

ConfigManager::ConfigManager()
    : config_(defaults())
{
}

battctl_err_t ConfigManager::reject(std::string message, std::atomic<uint32_t> &counter)
{
    counter.fetch_add(1, std::memory_order_relaxed);
    BATTCTL_LOGE(TAG, "Configuration rejected: %s", message.c_str());
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = std::move(message);
    return BATTCTL_ERR_INVALID_ARG;
}

battctl_err_t ConfigManager::load_file(const std::string &path)
{
    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        if (errno == ENOENT) {
            BATTCTL_LOGI(TAG, "No configuration at %s, using defaults", path.c_str());
            return BATTCTL_OK;
        }
        BATTCTL_LOGE(TAG, "Cannot open %s: %s", path.c_str(), std::strerror(errno));
        return BATTCTL_ERR_IO;
    }

    std::string contents;
    contents.reserve(4096);
    char chunk[4096];
    while (file.read(chunk, sizeof(chunk)) || file.gcount() > 0) {
        contents.append(chunk, static_cast<size_t>(file.gcount()));
        if (contents.size() > constants::kMaxConfigFileSize) {
            return reject(path + " is too large", parse_failures_);
        }
    }
    if (file.bad()) {
        BATTCTL_LOGE(TAG, "Read error on %s", path.c_str());
        return BATTCTL_ERR_IO;
    }

    const battctl_err_t err = load_from_string(contents);
    if (err == BATTCTL_OK) {
        BATTCTL_LOGI(TAG, "Loaded configuration from %s", path.c_str());
    }
    return err;
}

battctl_err_t ConfigManager::load_from_string(std::string_view json)
{
    UniqueCJson root(cJSON_ParseWithLength(json.data(), json.size()));
    if (!root || !cJSON_IsObject(root.get())) {
        return reject("configuration is not a JSON object", parse_failures_);
    }

    AgentConfig candidate = defaults();

    struct Check {
        const char *name;
        FieldResult result;
    };
    const Check checks[] = {
        {"socket_path", read_string(root.get(), "socket_path", candidate.socket_path)},
        {"allowed_uids", read_uid_list(root.get(), "allowed_uids", candidate.allowed_uids)},
        {"request_timeout_ms", read_uint32(root.get(), "request_timeout_ms", candidate.request_timeout_ms)},
        {"telemetry_timeout_ms", read_uint32(root.get(), "telemetry_timeout_ms", candidate.telemetry_timeout_ms)},
        {"telemetry_cache_ms", read_uint32(root.get(), "telemetry_cache_ms", candidate.telemetry_cache_ms)},
        {"log_level", read_string(root.get(), "log_level", candidate.log_level)},
        {"log_to_stderr", read_bool(root.get(), "log_to_stderr", candidate.log_to_stderr)},
    };
    for (const auto &check : checks) {
        if (check.result == FieldResult::WrongType) {
            return reject(std::string(check.name) + " has the wrong type", parse_failures_);
        }
    }

    uint32_t gid = 0;
    const FieldResult gid_result = read_uint32(root.get(), "allowed_gid", gid);
    if (gid_result == FieldResult::WrongType) {
        return reject("allowed_gid has the wrong type", parse_failures_);
    }
    if (gid_result == FieldResult::Ok) {
        candidate.allowed_gid = gid;
    }

    const auto validation = Validator::validate(candidate);
    if (!validation) {
        return reject(validation.error_message, validation_failures_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::move(candidate);
    last_error_.clear();
    loads_.fetch_add(1, std::memory_order_relaxed);
    return BATTCTL_OK;
}

AgentConfig ConfigManager::get() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

std::string ConfigManager::get_socket_path() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.socket_path;
}

uint32_t ConfigManager::get_request_timeout_ms() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.request_timeout_ms;
}

uint32_t ConfigManager::get_telemetry_timeout_ms() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.telemetry_timeout_ms;
}

uint32_t ConfigManager::get_telemetry_cache_ms() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.telemetry_cache_ms;
}

std::string ConfigManager::last_error() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

ConfigManager::Stats ConfigManager::get_stats() const
{
    return Stats{
        loads_.load(std::memory_order_relaxed),
        parse_failures_.load(std::memory_order_relaxed),
        validation_failures_.load(std::memory_order_relaxed),
    };
}

} // namespace battctl
