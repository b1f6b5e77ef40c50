/**
 * @file register_map.cpp
 * @brief RegisterMap implementation
 */

#include "register_map.hpp"

#include "battctl_log.h"
#include "smc_codec.hpp"

namespace battctl {

namespace {
const char *TAG = "register_map";
} // namespace

RegisterMap::RegisterMap(SmcSession &session)
    : session_(session)
{
}

bool RegisterMap::ensure_connected_locked()
{
    if (session_.is_connected()) {
        return true;
    }
    if (!session_.connect()) {
        BATTCTL_LOGE(TAG, "SMC connection unavailable");
        return false;
    }
    return true;
}

bool RegisterMap::connect()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return ensure_connected_locked();
}

bool RegisterMap::probe_exists_locked(RegisterKey key)
{
    if (!ensure_connected_locked()) {
        return false;
    }
    RegisterInfo info;
    return static_cast<bool>(session_.read_key_info(key, info));
}

bool RegisterMap::probe_exists(RegisterKey key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return probe_exists_locked(key);
}

battctl_err_t RegisterMap::get_key_info(RegisterKey key, RegisterInfo &info)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_connected_locked()) {
        return BATTCTL_ERR_NOT_OPEN;
    }
    return session_.read_key_info(key, info).err;
}

battctl_err_t RegisterMap::read(RegisterKey key, RegisterValue &value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_connected_locked()) {
        return BATTCTL_ERR_NOT_OPEN;
    }

    const CallStatus status = session_.read_key(key, value);
    if (!status && status.err != BATTCTL_ERR_NOT_FOUND) {
        BATTCTL_LOGW(TAG, "Read %s failed: %s", key.to_string().c_str(), battctl_err_to_name(status.err));
    }
    return status.err;
}

battctl_err_t RegisterMap::write(RegisterKey key, const RegisterValue &value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_connected_locked()) {
        return BATTCTL_ERR_NOT_OPEN;
    }

    const std::string name = key.to_string();

    RegisterInfo info;
    CallStatus status = session_.read_key_info(key, info);
    if (!status) {
        return status.err;
    }
    if (info.type != value.type) {
        BATTCTL_LOGE(TAG, "Refusing write to %s: declared type %s, value type %s", name.c_str(),
                     std::string(register_type_code_name(info.type)).c_str(),
                     std::string(register_type_code_name(value.type)).c_str());
        return BATTCTL_ERR_TYPE_MISMATCH;
    }
    if (info.data_size != value.length) {
        BATTCTL_LOGE(TAG, "Refusing write to %s: declared size %u, value size %zu", name.c_str(),
                     static_cast<unsigned>(info.data_size), value.length);
        return BATTCTL_ERR_INVALID_SIZE;
    }

    status = session_.write_key(key, value);
    if (!status) {
        BATTCTL_LOGE(TAG, "Write %s failed: %s (0x%08x)", name.c_str(), battctl_err_to_name(status.err),
                     status.os_status);
        return status.err;
    }

    BATTCTL_LOGI(TAG, "Wrote %s = %s", name.c_str(), format_register_value(value).c_str());
    return BATTCTL_OK;
}

std::optional<HardwareVariant> RegisterMap::resolve_variant()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (cached_variant_) {
        return cached_variant_;
    }

    if (probe_exists_locked(keys::kChargeLimitWide)) {
        cached_variant_ = HardwareVariant::WideRange;
    } else if (probe_exists_locked(keys::kChargeLimitBinary)) {
        cached_variant_ = HardwareVariant::BinaryRange;
    }

    if (cached_variant_) {
        BATTCTL_LOGI(TAG, "Hardware variant: %s", hardware_variant_name(*cached_variant_));
    } else {
        BATTCTL_LOGW(TAG, "No charge-limit register found");
    }
    return cached_variant_;
}

void RegisterMap::invalidate_variant()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cached_variant_.reset();
}

std::vector<std::string> RegisterMap::list_available_keys()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> available;
    for (const auto &desc : register_catalog()) {
        if (probe_exists_locked(desc.key)) {
            available.push_back(desc.key.to_string());
        }
    }
    return available;
}

} // namespace battctl
