/**
 * @file agent_protocol.cpp
 * @brief JSON encoding of agent requests and responses
 */

#include "agent_protocol.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

#include "cjson_utils.hpp"

namespace battctl {

namespace {

struct OperationName {
    Operation operation;
    std::string_view name;
};

constexpr std::array<OperationName, 5> kOperationNames = {{
    {Operation::SetChargeLimit, "setChargeLimit"},
    {Operation::SetChargingEnabled, "setChargingEnabled"},
    {Operation::GetStatus, "getStatus"},
    {Operation::GetVersion, "getVersion"},
    {Operation::RunDiagnostics, "runDiagnostics"},
}};

std::string_view trim_line(std::string_view line)
{
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    return line;
}

battctl_err_t finish_line(const cJSON *root, std::string &line)
{
    auto text = print_json(root);
    if (!text) {
        return BATTCTL_ERR_NO_MEM;
    }
    if (text->size() + 1 > constants::kMaxFrameLength) {
        return BATTCTL_ERR_INVALID_SIZE;
    }
    line = std::move(*text);
    line += '\n';
    return BATTCTL_OK;
}

const char *string_field(const cJSON *object, const char *name)
{
    const cJSON *item = cJSON_GetObjectItemCaseSensitive(object, name);
    if (cJSON_IsString(item) && item->valuestring != nullptr) {
        return item->valuestring;
    }
    return nullptr;
}

bool add_data_string(cJSON *data, const char *name, const std::string &value)
{
    return cJSON_AddStringToObject(data, name, value.c_str()) != nullptr;
}

std::string join_keys(const std::vector<std::string> &keys)
{
    std::string joined;
    for (const auto &key : keys) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += key;
    }
    return joined;
}

std::vector<std::string> split_keys(std::string_view joined)
{
    std::vector<std::string> keys;
    while (!joined.empty()) {
        const size_t comma = joined.find(',');
        const std::string_view part = joined.substr(0, comma);
        if (!part.empty()) {
            keys.emplace_back(part);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        joined.remove_prefix(comma + 1);
    }
    return keys;
}

bool fill_status_data(cJSON *data, const StatusReply &status)
{
    bool ok = true;
    if (status.charge_limit) {
        ok = ok && add_data_string(data, "chargeLimit", std::to_string(*status.charge_limit));
    }
    if (status.charging_enabled) {
        ok = ok && add_data_string(data, "chargingEnabled", *status.charging_enabled ? "true" : "false");
    }
    if (status.temperature) {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.1f", *status.temperature);
        ok = ok && add_data_string(data, "temperature", buffer);
    }
    if (!status.available_keys.empty()) {
        ok = ok && add_data_string(data, "availableKeys", join_keys(status.available_keys));
    }
    return ok;
}

StatusReply parse_status_data(const cJSON *data)
{
    StatusReply status;
    if (data == nullptr) {
        return status;
    }

    if (const char *text = string_field(data, "chargeLimit")) {
        int limit = 0;
        const std::string_view view(text);
        const auto [ptr, ec] = std::from_chars(view.data(), view.data() + view.size(), limit);
        if (ec == std::errc() && ptr == view.data() + view.size()) {
            status.charge_limit = limit;
        }
    }
    if (const char *text = string_field(data, "chargingEnabled")) {
        const std::string_view view(text);
        if (view == "true") {
            status.charging_enabled = true;
        } else if (view == "false") {
            status.charging_enabled = false;
        }
    }
    if (const char *text = string_field(data, "temperature")) {
        char *end = nullptr;
        const double value = std::strtod(text, &end);
        if (end != text && *end == '\0' && std::isfinite(value)) {
            status.temperature = value;
        }
    }
    if (const char *text = string_field(data, "availableKeys")) {
        status.available_keys = split_keys(text);
    }
    return status;
}

} // namespace

const char *operation_name(Operation operation)
{
    for (const auto &entry : kOperationNames) {
        if (entry.operation == operation) {
            return entry.name.data();
        }
    }
    return "unknown";
}

std::optional<Operation> operation_from_name(std::string_view name)
{
    for (const auto &entry : kOperationNames) {
        if (entry.name == name) {
            return entry.operation;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Requests
// =============================================================================

battctl_err_t encode_request(const ControlRequest &request, std::string &line)
{
    UniqueCJson root(cJSON_CreateObject());
    if (!root) {
        return BATTCTL_ERR_NO_MEM;
    }
    if (cJSON_AddStringToObject(root.get(), "operation", operation_name(request.operation)) == nullptr) {
        return BATTCTL_ERR_NO_MEM;
    }
    if (request.value && cJSON_AddNumberToObject(root.get(), "value", *request.value) == nullptr) {
        return BATTCTL_ERR_NO_MEM;
    }
    return finish_line(root.get(), line);
}

battctl_err_t decode_request(std::string_view line, ControlRequest &request, std::string &error)
{
    line = trim_line(line);
    UniqueCJson root(cJSON_ParseWithLength(line.data(), line.size()));
    if (!root || !cJSON_IsObject(root.get())) {
        error = "Malformed request";
        return BATTCTL_ERR_PROTOCOL;
    }

    const char *name = string_field(root.get(), "operation");
    if (name == nullptr) {
        name = string_field(root.get(), "action");
    }
    if (name == nullptr) {
        error = "Missing operation";
        return BATTCTL_ERR_PROTOCOL;
    }

    const auto operation = operation_from_name(name);
    if (!operation) {
        error = std::string("Unknown operation: ") + name;
        return BATTCTL_ERR_PROTOCOL;
    }

    std::optional<int> value;
    const cJSON *value_item = cJSON_GetObjectItemCaseSensitive(root.get(), "value");
    if (value_item != nullptr && !cJSON_IsNull(value_item)) {
        if (!cJSON_IsNumber(value_item)) {
            error = "Value must be an integer";
            return BATTCTL_ERR_PROTOCOL;
        }
        const double number = value_item->valuedouble;
        if (std::floor(number) != number || number < std::numeric_limits<int>::min() ||
            number > std::numeric_limits<int>::max()) {
            error = "Value must be an integer";
            return BATTCTL_ERR_PROTOCOL;
        }
        value = static_cast<int>(number);
    }

    if (*operation == Operation::SetChargeLimit || *operation == Operation::SetChargingEnabled) {
        if (!value) {
            error = "Missing value";
            return BATTCTL_ERR_PROTOCOL;
        }
    }
    if (*operation == Operation::SetChargingEnabled && *value != 0 && *value != 1) {
        error = "Value must be 0 or 1";
        return BATTCTL_ERR_PROTOCOL;
    }

    request.operation = *operation;
    request.value = value;
    return BATTCTL_OK;
}

// =============================================================================
// Responses
// =============================================================================

battctl_err_t encode_response(const ControlResponse &response, std::string &line)
{
    UniqueCJson root(cJSON_CreateObject());
    if (!root) {
        return BATTCTL_ERR_NO_MEM;
    }

    cJSON_AddBoolToObject(root.get(), "success", response.success);
    if (response.message) {
        cJSON_AddStringToObject(root.get(), "message", response.message->c_str());
    }

    if (!std::holds_alternative<std::monostate>(response.payload) || response.status) {
        cJSON *data = cJSON_AddObjectToObject(root.get(), "data");
        if (data == nullptr) {
            return BATTCTL_ERR_NO_MEM;
        }

        bool ok = true;
        if (const auto *status = std::get_if<StatusReply>(&response.payload)) {
            ok = fill_status_data(data, *status);
        } else if (const auto *version = std::get_if<VersionReply>(&response.payload)) {
            ok = add_data_string(data, "version", version->version);
        } else if (const auto *diagnostics = std::get_if<DiagnosticsReply>(&response.payload)) {
            ok = add_data_string(data, "report", diagnostics->report);
        }
        if (ok && response.status) {
            ok = add_data_string(data, "status", *response.status);
        }
        if (!ok) {
            return BATTCTL_ERR_NO_MEM;
        }
    }

    return finish_line(root.get(), line);
}

battctl_err_t decode_response(std::string_view line, Operation sent, ControlResponse &response)
{
    line = trim_line(line);
    UniqueCJson root(cJSON_ParseWithLength(line.data(), line.size()));
    if (!root || !cJSON_IsObject(root.get())) {
        return BATTCTL_ERR_PROTOCOL;
    }

    const cJSON *success = cJSON_GetObjectItemCaseSensitive(root.get(), "success");
    if (!cJSON_IsBool(success)) {
        return BATTCTL_ERR_PROTOCOL;
    }

    ControlResponse parsed;
    parsed.success = cJSON_IsTrue(success);
    if (const char *message = string_field(root.get(), "message")) {
        parsed.message = message;
    }

    const cJSON *data = cJSON_GetObjectItemCaseSensitive(root.get(), "data");
    if (data != nullptr && !cJSON_IsObject(data)) {
        return BATTCTL_ERR_PROTOCOL;
    }

    if (data != nullptr) {
        if (const char *status = string_field(data, "status")) {
            parsed.status = status;
        }
    }

    if (parsed.success) {
        switch (sent) {
            case Operation::GetStatus:
                parsed.payload = parse_status_data(data);
                break;
            case Operation::GetVersion: {
                const char *version = data != nullptr ? string_field(data, "version") : nullptr;
                parsed.payload = VersionReply{version != nullptr ? version : ""};
                break;
            }
            case Operation::RunDiagnostics: {
                const char *report = data != nullptr ? string_field(data, "report") : nullptr;
                parsed.payload = DiagnosticsReply{report != nullptr ? report : ""};
                break;
            }
            default:
                break;
        }
    }

    response = std::move(parsed);
    return BATTCTL_OK;
}

// =============================================================================
// Framing
// =============================================================================

battctl_err_t LineBuffer::append(const char *data, size_t length)
{
    pending_.append(data, length);

    size_t start = 0;
    while (start <= pending_.size()) {
        const size_t newline = pending_.find('\n', start);
        const size_t end = newline == std::string::npos ? pending_.size() : newline;
        if (end - start > max_line_) {
            return BATTCTL_ERR_INVALID_SIZE;
        }
        if (newline == std::string::npos) {
            break;
        }
        start = newline + 1;
    }
    return BATTCTL_OK;
}

std::optional<std::string> LineBuffer::next_line()
{
    const size_t newline = pending_.find('\n');
    if (newline == std::string::npos) {
        return std::nullopt;
    }
    std::string line = pending_.substr(0, newline);
    pending_.erase(0, newline + 1);
    return line;
}

} // namespace battctl
