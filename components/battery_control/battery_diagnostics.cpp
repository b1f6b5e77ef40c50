/**
 * @file battery_diagnostics.cpp
 * @brief Read-only capability report and its text/JSON renderings
 */

#include <cstdio>

#include "battery_control.hpp"
#include "battctl_log.h"
#include "cjson_utils.hpp"
#include "smc_codec.hpp"

namespace battctl {

namespace {
const char *TAG = "battery_diag";

template <typename T>
std::string optional_text(const std::optional<T> &value, const char *format)
{
    if (!value) {
        return "unavailable";
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), format, *value);
    return buffer;
}

std::string optional_bool_text(const std::optional<bool> &value, const char *when_true, const char *when_false)
{
    if (!value) {
        return "unavailable";
    }
    return *value ? when_true : when_false;
}

} // namespace

DiagnosticReport BatteryControl::run_diagnostics()
{
    DiagnosticReport report;
    report.can_write = privilege_.can_write();
    report.smc_connected = registers_.connect();
    if (!report.smc_connected) {
        BATTCTL_LOGW(TAG, "Diagnostics without SMC connection");
        return report;
    }

    for (const auto &desc : register_catalog()) {
        KeyReport entry;
        entry.key = desc.key.to_string();
        entry.label = desc.label;

        // Presence is the key-info lookup alone; a key may exist and still refuse reads.
        entry.present = registers_.probe_exists(desc.key);
        if (entry.present) {
            RegisterValue value;
            const battctl_err_t err = registers_.read(desc.key, value);
            entry.value = err == BATTCTL_OK ? format_register_value(value) : battctl_err_to_name(err);
        }
        report.keys.push_back(std::move(entry));
    }

    report.variant = registers_.resolve_variant();
    report.charge_limit = get_charge_limit();
    report.charging_enabled = is_charging_enabled();
    report.temperature_c = get_battery_temperature();
    report.cycle_count = get_cycle_count();
    report.battery_count = get_battery_count();
    report.battery_powered = is_battery_powered();
    return report;
}

std::string format_diagnostics_text(const DiagnosticReport &report)
{
    std::string text;
    text += "SMC connection:    ";
    text += report.smc_connected ? "ok\n" : "unavailable\n";
    text += "Hardware variant:  ";
    text += report.variant ? hardware_variant_name(*report.variant) : "unsupported";
    text += "\n";
    text += "Write privilege:   ";
    text += report.can_write ? "yes\n" : "no\n";
    text += "Charge limit:      " + optional_text(report.charge_limit, "%d%%") + "\n";
    text += "Charging:          " + optional_bool_text(report.charging_enabled, "enabled", "inhibited") + "\n";
    text += "Temperature:       " + optional_text(report.temperature_c, "%.1f C") + "\n";
    text += "Cycle count:       " + optional_text(report.cycle_count, "%d") + "\n";
    text += "Battery count:     " + optional_text(report.battery_count, "%d") + "\n";
    text += "Power source:      " + optional_bool_text(report.battery_powered, "battery", "external") + "\n";

    if (!report.keys.empty()) {
        text += "\nKeys:\n";
        for (const auto &entry : report.keys) {
            char line[128];
            std::snprintf(line, sizeof(line), "  %s  %-8s %s\n", entry.key.c_str(),
                          entry.present ? "present" : "missing", entry.value.c_str());
            text += line;
        }
    }
    return text;
}

std::optional<std::string> format_diagnostics_json(const DiagnosticReport &report)
{
    UniqueCJson root(cJSON_CreateObject());
    if (!root) {
        return std::nullopt;
    }

    cJSON_AddBoolToObject(root.get(), "smcConnected", report.smc_connected);
    if (report.variant) {
        cJSON_AddStringToObject(root.get(), "variant", hardware_variant_name(*report.variant));
    } else {
        cJSON_AddNullToObject(root.get(), "variant");
    }
    cJSON_AddBoolToObject(root.get(), "canWrite", report.can_write);

    if (report.charge_limit) {
        cJSON_AddNumberToObject(root.get(), "chargeLimit", *report.charge_limit);
    }
    if (report.charging_enabled) {
        cJSON_AddBoolToObject(root.get(), "chargingEnabled", *report.charging_enabled);
    }
    if (report.temperature_c) {
        cJSON_AddNumberToObject(root.get(), "temperature", *report.temperature_c);
    }
    if (report.cycle_count) {
        cJSON_AddNumberToObject(root.get(), "cycleCount", *report.cycle_count);
    }
    if (report.battery_count) {
        cJSON_AddNumberToObject(root.get(), "batteryCount", *report.battery_count);
    }
    if (report.battery_powered) {
        cJSON_AddBoolToObject(root.get(), "batteryPowered", *report.battery_powered);
    }

    cJSON *keys = cJSON_AddArrayToObject(root.get(), "keys");
    if (keys == nullptr) {
        return std::nullopt;
    }
    for (const auto &entry : report.keys) {
        cJSON *item = cJSON_CreateObject();
        if (item == nullptr) {
            return std::nullopt;
        }
        cJSON_AddItemToArray(keys, item);
        cJSON_AddStringToObject(item, "key", entry.key.c_str());
        cJSON_AddStringToObject(item, "label", entry.label.c_str());
        cJSON_AddBoolToObject(item, "present", entry.present);
        if (!entry.value.empty()) {
            cJSON_AddStringToObject(item, "value", entry.value.c_str());
        }
    }

    return print_json(root.get());
}

} // namespace battctl
