/**
 * @file iops_power_source_reader.cpp
 * @brief IOPowerSources snapshot parsing
 */

#include "iops_power_source_reader.hpp"

#include <CoreFoundation/CoreFoundation.h>
#include <IOKit/ps/IOPSKeys.h>
#include <IOKit/ps/IOPowerSources.h>

#include "battctl_log.h"

namespace battctl {

namespace {
const char *TAG = "power_source";

template <typename T>
class CfRef {
public:
    explicit CfRef(T ref)
        : ref_(ref)
    {
    }
    ~CfRef()
    {
        if (ref_ != nullptr) {
            CFRelease(ref_);
        }
    }

    CfRef(const CfRef &) = delete;
    CfRef &operator=(const CfRef &) = delete;

    T get() const { return ref_; }
    explicit operator bool() const { return ref_ != nullptr; }

private:
    T ref_;
};

bool dict_int(CFDictionaryRef dict, CFStringRef key, int &out)
{
    const auto number = static_cast<CFNumberRef>(CFDictionaryGetValue(dict, key));
    if (number == nullptr || CFGetTypeID(number) != CFNumberGetTypeID()) {
        return false;
    }
    return CFNumberGetValue(number, kCFNumberIntType, &out);
}

bool dict_bool(CFDictionaryRef dict, CFStringRef key, bool fallback)
{
    const auto value = static_cast<CFBooleanRef>(CFDictionaryGetValue(dict, key));
    if (value == nullptr || CFGetTypeID(value) != CFBooleanGetTypeID()) {
        return fallback;
    }
    return CFBooleanGetValue(value);
}

} // namespace

battctl_err_t IopsPowerSourceReader::read(PowerSourceSnapshot &snapshot)
{
    CfRef<CFTypeRef> info(IOPSCopyPowerSourcesInfo());
    if (!info) {
        BATTCTL_LOGE(TAG, "IOPSCopyPowerSourcesInfo failed");
        return BATTCTL_ERR_SERVICE_NOT_FOUND;
    }

    CfRef<CFArrayRef> sources(IOPSCopyPowerSourcesList(info.get()));
    if (!sources || CFArrayGetCount(sources.get()) == 0) {
        BATTCTL_LOGW(TAG, "No power sources found");
        return BATTCTL_ERR_NOT_FOUND;
    }

    const CFIndex count = CFArrayGetCount(sources.get());
    for (CFIndex i = 0; i < count; ++i) {
        CFTypeRef source = CFArrayGetValueAtIndex(sources.get(), i);
        CFDictionaryRef description = IOPSGetPowerSourceDescription(info.get(), source);
        if (description == nullptr) {
            continue;
        }

        PowerSourceSnapshot parsed;
        if (!dict_int(description, CFSTR(kIOPSCurrentCapacityKey), parsed.current_capacity) ||
            !dict_int(description, CFSTR(kIOPSMaxCapacityKey), parsed.max_capacity)) {
            BATTCTL_LOGW(TAG, "Power source without capacity information");
            continue;
        }

        parsed.is_charging = dict_bool(description, CFSTR(kIOPSIsChargingKey), false);

        const auto state = static_cast<CFStringRef>(CFDictionaryGetValue(description, CFSTR(kIOPSPowerSourceStateKey)));
        parsed.is_plugged_in = state != nullptr && CFGetTypeID(state) == CFStringGetTypeID() &&
                               CFStringCompare(state, CFSTR(kIOPSACPowerValue), 0) == kCFCompareEqualTo;

        snapshot = parsed;
        BATTCTL_LOGD(TAG, "Battery %d%%, charging=%d, plugged=%d", parsed.current_capacity, parsed.is_charging,
                     parsed.is_plugged_in);
        return BATTCTL_OK;
    }

    return BATTCTL_ERR_NOT_FOUND;
}

} // namespace battctl
