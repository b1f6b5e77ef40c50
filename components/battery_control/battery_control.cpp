/**
 * @file battery_control.cpp
 * @brief BatteryControl implementation
 */

#include "battery_control.hpp"

#include <cstdio>

#include "battctl_log.h"
#include "smc_codec.hpp"

namespace battctl {

namespace {
const char *TAG = "battery_control";
} // namespace

BatteryControl::BatteryControl(RegisterMap &registers, PrivilegeContext privilege)
    : registers_(registers)
    , privilege_(privilege)
{
}

void BatteryControl::note_missing(RegisterKey key, battctl_err_t err)
{
    if (err != BATTCTL_ERR_NOT_FOUND) {
        return;
    }
    const auto *desc = find_register(key);
    if (desc != nullptr && desc->scope != VariantScope::Any) {
        BATTCTL_LOGW(TAG, "%s disappeared, re-probing hardware variant", key.to_string().c_str());
        registers_.invalidate_variant();
    }
}

// =============================================================================
// Charge limit
// =============================================================================

ControlResult BatteryControl::set_charge_limit(int percent)
{
    if (percent < constants::kChargeLimitMin || percent > constants::kChargeLimitMax) {
        char message[64];
        std::snprintf(message, sizeof(message), "Charge limit must be between %d and %d",
                      constants::kChargeLimitMin, constants::kChargeLimitMax);
        return ControlResult::failed(message);
    }

    const auto variant = registers_.resolve_variant();
    if (!variant) {
        return ControlResult::not_supported("Charge limit control is not available on this hardware");
    }

    const auto raw = charge_limit_to_raw(*variant, percent);
    if (!raw) {
        return ControlResult::not_supported("This hardware only supports 80% or 100% limits");
    }

    if (!privilege_.can_write()) {
        return ControlResult::requires_privilege();
    }

    const RegisterKey key = charge_limit_key(*variant);
    RegisterValue value;
    battctl_err_t err = encode_integer(RegisterType::UInt8, *raw, value);
    if (err == BATTCTL_OK) {
        err = registers_.write(key, value);
    }
    if (err != BATTCTL_OK) {
        note_missing(key, err);
        return ControlResult::failed(std::string("Failed to write ") + key.to_string() + ": " +
                                     battctl_err_to_name(err));
    }

    BATTCTL_LOGI(TAG, "Charge limit set to %d%% (%s raw %u)", percent, key.to_string().c_str(),
                 static_cast<unsigned>(*raw));
    return ControlResult::success("Charge limit set to " + std::to_string(percent) + "%");
}

std::optional<int> BatteryControl::get_charge_limit()
{
    const auto variant = registers_.resolve_variant();
    if (!variant) {
        return std::nullopt;
    }

    const RegisterKey key = charge_limit_key(*variant);
    RegisterValue value;
    const battctl_err_t err = registers_.read(key, value);
    if (err != BATTCTL_OK) {
        note_missing(key, err);
        return std::nullopt;
    }

    uint8_t raw = 0;
    if (decode_uint8(value, raw) != BATTCTL_OK) {
        BATTCTL_LOGW(TAG, "Unexpected %s payload: %s", key.to_string().c_str(), format_register_value(value).c_str());
        return std::nullopt;
    }
    return charge_limit_from_raw(*variant, raw);
}

// =============================================================================
// Charge enable
// =============================================================================

ControlResult BatteryControl::set_charging_enabled(bool enabled)
{
    if (!privilege_.can_write()) {
        return ControlResult::requires_privilege();
    }

    const HardwareVariant variant = registers_.resolve_variant().value_or(HardwareVariant::WideRange);

    RegisterValue value;
    const battctl_err_t encode_err = encode_integer(RegisterType::Hex8, charge_enable_to_raw(enabled), value);
    if (encode_err != BATTCTL_OK) {
        return ControlResult::failed(std::string("Encoding failed: ") + battctl_err_to_name(encode_err));
    }

    for (const RegisterKey key : charge_enable_candidates(variant)) {
        const battctl_err_t err = registers_.write(key, value);
        if (err == BATTCTL_ERR_NOT_FOUND) {
            BATTCTL_LOGD(TAG, "%s not present, trying next key", key.to_string().c_str());
            continue;
        }
        if (err != BATTCTL_OK) {
            return ControlResult::failed(std::string("Failed to write ") + key.to_string() + ": " +
                                         battctl_err_to_name(err));
        }

        BATTCTL_LOGI(TAG, "Charging %s via %s", enabled ? "enabled" : "disabled", key.to_string().c_str());
        return ControlResult::success(enabled ? "Charging enabled" : "Charging disabled");
    }

    return ControlResult::not_supported("No charge-enable register on this hardware");
}

std::optional<bool> BatteryControl::is_charging_enabled()
{
    const HardwareVariant variant = registers_.resolve_variant().value_or(HardwareVariant::WideRange);

    for (const RegisterKey key : charge_enable_candidates(variant)) {
        RegisterValue value;
        const battctl_err_t err = registers_.read(key, value);
        if (err == BATTCTL_ERR_NOT_FOUND) {
            continue;
        }
        if (err != BATTCTL_OK) {
            return std::nullopt;
        }

        uint8_t raw = 0;
        if (decode_hex8(value, raw) != BATTCTL_OK) {
            BATTCTL_LOGW(TAG, "Unexpected %s payload: %s", key.to_string().c_str(),
                         format_register_value(value).c_str());
            return std::nullopt;
        }
        return charge_enable_from_raw(raw);
    }
    return std::nullopt;
}

// =============================================================================
// Telemetry
// =============================================================================

std::optional<double> BatteryControl::get_battery_temperature()
{
    for (const RegisterKey key : keys::kTemperatureSensors) {
        RegisterValue value;
        if (registers_.read(key, value) != BATTCTL_OK) {
            continue;
        }
        double celsius = 0.0;
        if (decode_temperature(value, celsius) == BATTCTL_OK && celsius > 0.0) {
            return celsius;
        }
    }
    return std::nullopt;
}

std::optional<int> BatteryControl::get_cycle_count()
{
    RegisterValue value;
    if (registers_.read(keys::kCycleCount, value) != BATTCTL_OK) {
        return std::nullopt;
    }
    uint16_t cycles = 0;
    if (decode_uint16(value, cycles) != BATTCTL_OK) {
        return std::nullopt;
    }
    return static_cast<int>(cycles);
}

std::optional<int> BatteryControl::get_battery_count()
{
    RegisterValue value;
    if (registers_.read(keys::kBatteryCount, value) != BATTCTL_OK) {
        return std::nullopt;
    }
    uint8_t count = 0;
    if (decode_uint8(value, count) != BATTCTL_OK) {
        return std::nullopt;
    }
    return static_cast<int>(count);
}

std::optional<bool> BatteryControl::is_battery_powered()
{
    RegisterValue value;
    if (registers_.read(keys::kBatteryPowered, value) != BATTCTL_OK) {
        return std::nullopt;
    }
    bool powered = false;
    if (decode_flag(value, powered) != BATTCTL_OK) {
        return std::nullopt;
    }
    return powered;
}

} // namespace battctl
