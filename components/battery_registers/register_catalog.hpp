/**
 * @file register_catalog.hpp
 * @brief Battery related SMC keys and their per-variant meaning
 *
 * Two hardware generations expose charge control through different keys:
 *
 *   WideRange    BCLM holds the limit as a percentage, CH0B gates charging
 *   BinaryRange  CHWA only toggles between 100% (0) and 80% (1), CH0C gates
 *
 * Charge-enable registers hold 0 when charging is allowed and 1 when it is
 * inhibited on both generations.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>

#include "smc_types.hpp"

namespace battctl {

enum class HardwareVariant : uint8_t {
    WideRange,
    BinaryRange,
};

const char *hardware_variant_name(HardwareVariant variant);

enum class RegisterRole : uint8_t {
    ChargeEnable,
    ChargeLimit,
    BatteryPowered,
    BatteryCount,
    BatteryInfo,
    Temperature,
    CycleCount,
};

enum class VariantScope : uint8_t {
    Any,
    WideRangeOnly,
    BinaryRangeOnly,
};

struct RegisterDescriptor {
    RegisterKey key;
    RegisterRole role;
    RegisterType type;
    VariantScope scope;
    const char *label;
};

namespace keys {
constexpr RegisterKey kChargeEnableWide{"CH0B"};
constexpr RegisterKey kChargeEnableBinary{"CH0C"};
constexpr RegisterKey kChargeLimitWide{"BCLM"};
constexpr RegisterKey kChargeLimitBinary{"CHWA"};
constexpr RegisterKey kBatteryPowered{"BATP"};
constexpr RegisterKey kBatteryCount{"BNum"};
constexpr RegisterKey kBatteryInfo{"BSIn"};
constexpr RegisterKey kCycleCount{"B0CT"};
constexpr std::array<RegisterKey, 4> kTemperatureSensors = {
    RegisterKey{"TB0T"}, RegisterKey{"TB1T"}, RegisterKey{"TB2T"}, RegisterKey{"TB3T"}};
} // namespace keys

namespace constants {
constexpr int kChargeLimitMin = 20;
constexpr int kChargeLimitMax = 100;
constexpr int kBinaryRangeReducedLimit = 80;
constexpr uint8_t kBinaryRangeRawFull = 0;
constexpr uint8_t kBinaryRangeRawReduced = 1;
constexpr uint8_t kChargeEnableRawEnabled = 0;
constexpr uint8_t kChargeEnableRawDisabled = 1;
} // namespace constants

/// Full catalog in listing order
std::span<const RegisterDescriptor> register_catalog();

/// nullptr when the key is not part of the catalog
const RegisterDescriptor *find_register(RegisterKey key);

RegisterKey charge_limit_key(HardwareVariant variant);

/// The variant's own charge-enable key first, the other generation's second
std::array<RegisterKey, 2> charge_enable_candidates(HardwareVariant variant);

/**
 * @brief Converts a percentage into the variant's raw limit value
 *
 * WideRange accepts 20..100 as is. BinaryRange only accepts 80 and 100.
 */
std::optional<uint8_t> charge_limit_to_raw(HardwareVariant variant, int percent);

/// Inverse of charge_limit_to_raw; nullopt for raw values with no meaning
std::optional<int> charge_limit_from_raw(HardwareVariant variant, uint8_t raw);

uint8_t charge_enable_to_raw(bool enabled);
bool charge_enable_from_raw(uint8_t raw);

} // namespace battctl
