/**
 * @file register_catalog.cpp
 * @brief Battery register catalog and raw/user conversions
 */

#include "register_catalog.hpp"

namespace battctl {

namespace {

// Listing order of support reports: charge gates, limits, then telemetry.
constexpr std::array<RegisterDescriptor, 12> kCatalog = {{
    {keys::kChargeEnableWide, RegisterRole::ChargeEnable, RegisterType::Hex8, VariantScope::WideRangeOnly,
     "Charge inhibit"},
    {keys::kChargeEnableBinary, RegisterRole::ChargeEnable, RegisterType::Hex8, VariantScope::BinaryRangeOnly,
     "Charge inhibit"},
    {keys::kChargeLimitWide, RegisterRole::ChargeLimit, RegisterType::UInt8, VariantScope::WideRangeOnly,
     "Charge limit (percent)"},
    {keys::kChargeLimitBinary, RegisterRole::ChargeLimit, RegisterType::UInt8, VariantScope::BinaryRangeOnly,
     "Charge limit (0=100%, 1=80%)"},
    {keys::kBatteryPowered, RegisterRole::BatteryPowered, RegisterType::Flag, VariantScope::Any,
     "Running on battery"},
    {keys::kBatteryCount, RegisterRole::BatteryCount, RegisterType::UInt8, VariantScope::Any, "Battery count"},
    {keys::kBatteryInfo, RegisterRole::BatteryInfo, RegisterType::UInt8, VariantScope::Any, "Battery info"},
    {keys::kTemperatureSensors[0], RegisterRole::Temperature, RegisterType::FixedPointTemperature,
     VariantScope::Any, "Battery temperature 0"},
    {keys::kTemperatureSensors[1], RegisterRole::Temperature, RegisterType::FixedPointTemperature,
     VariantScope::Any, "Battery temperature 1"},
    {keys::kTemperatureSensors[2], RegisterRole::Temperature, RegisterType::FixedPointTemperature,
     VariantScope::Any, "Battery temperature 2"},
    {keys::kTemperatureSensors[3], RegisterRole::Temperature, RegisterType::FixedPointTemperature,
     VariantScope::Any, "Battery temperature 3"},
    {keys::kCycleCount, RegisterRole::CycleCount, RegisterType::UInt16, VariantScope::Any, "Cycle count"},
}};

} // namespace

const char *hardware_variant_name(HardwareVariant variant)
{
    switch (variant) {
        case HardwareVariant::WideRange:
            return "wide_range";
        case HardwareVariant::BinaryRange:
            return "binary_range";
    }
    return "unknown";
}

std::span<const RegisterDescriptor> register_catalog()
{
    return {kCatalog.data(), kCatalog.size()};
}

const RegisterDescriptor *find_register(RegisterKey key)
{
    for (const auto &desc : kCatalog) {
        if (desc.key == key) {
            return &desc;
        }
    }
    return nullptr;
}

RegisterKey charge_limit_key(HardwareVariant variant)
{
    return variant == HardwareVariant::WideRange ? keys::kChargeLimitWide : keys::kChargeLimitBinary;
}

std::array<RegisterKey, 2> charge_enable_candidates(HardwareVariant variant)
{
    if (variant == HardwareVariant::BinaryRange) {
        return {keys::kChargeEnableBinary, keys::kChargeEnableWide};
    }
    return {keys::kChargeEnableWide, keys::kChargeEnableBinary};
}

std::optional<uint8_t> charge_limit_to_raw(HardwareVariant variant, int percent)
{
    if (percent < constants::kChargeLimitMin || percent > constants::kChargeLimitMax) {
        return std::nullopt;
    }

    if (variant == HardwareVariant::WideRange) {
        return static_cast<uint8_t>(percent);
    }

    if (percent == constants::kChargeLimitMax) {
        return constants::kBinaryRangeRawFull;
    }
    if (percent == constants::kBinaryRangeReducedLimit) {
        return constants::kBinaryRangeRawReduced;
    }
    return std::nullopt;
}

std::optional<int> charge_limit_from_raw(HardwareVariant variant, uint8_t raw)
{
    if (variant == HardwareVariant::WideRange) {
        if (raw > constants::kChargeLimitMax) {
            return std::nullopt;
        }
        return static_cast<int>(raw);
    }

    switch (raw) {
        case constants::kBinaryRangeRawFull:
            return constants::kChargeLimitMax;
        case constants::kBinaryRangeRawReduced:
            return constants::kBinaryRangeReducedLimit;
        default:
            return std::nullopt;
    }
}

uint8_t charge_enable_to_raw(bool enabled)
{
    return enabled ? constants::kChargeEnableRawEnabled : constants::kChargeEnableRawDisabled;
}

bool charge_enable_from_raw(uint8_t raw)
{
    return raw == constants::kChargeEnableRawEnabled;
}

} // namespace battctl
