/**
 * @file iokit_smc_session.cpp
 * @brief IOKit implementation of SmcSession
 */

#include "iokit_smc_session.hpp"

#include <mach/mach.h>

#include "battctl_log.h"

namespace battctl {

namespace {
const char *TAG = "smc_iokit";
} // namespace

IokitSmcSession::~IokitSmcSession()
{
    disconnect();
}

bool IokitSmcSession::connect()
{
    if (connection_ != IO_OBJECT_NULL) {
        return true;
    }

    io_service_t service = IOServiceGetMatchingService(kIOMainPortDefault, IOServiceMatching(SMC_SERVICE_NAME));
    if (service == IO_OBJECT_NULL) {
        BATTCTL_LOGE(TAG, "%s service not found", SMC_SERVICE_NAME);
        return false;
    }

    io_connect_t connection = IO_OBJECT_NULL;
    const kern_return_t kr = IOServiceOpen(service, mach_task_self(), 0, &connection);
    IOObjectRelease(service);

    if (kr != KERN_SUCCESS) {
        BATTCTL_LOGE(TAG, "IOServiceOpen failed: 0x%08x", static_cast<unsigned>(kr));
        return false;
    }

    connection_ = connection;
    BATTCTL_LOGI(TAG, "Connected to %s", SMC_SERVICE_NAME);
    return true;
}

void IokitSmcSession::disconnect()
{
    if (connection_ == IO_OBJECT_NULL) {
        return;
    }

    const kern_return_t kr = IOServiceClose(connection_);
    if (kr != KERN_SUCCESS) {
        BATTCTL_LOGW(TAG, "IOServiceClose failed: 0x%08x", static_cast<unsigned>(kr));
    }
    connection_ = IO_OBJECT_NULL;
    BATTCTL_LOGD(TAG, "Disconnected");
}

CallStatus IokitSmcSession::do_call(const smc_param_struct_t &input, smc_param_struct_t &output)
{
    size_t output_size = sizeof(output);
    const kern_return_t kr = IOConnectCallStructMethod(connection_,
                                                       SMC_USER_CLIENT_METHOD,
                                                       &input,
                                                       sizeof(input),
                                                       &output,
                                                       &output_size);
    if (kr != KERN_SUCCESS) {
        return CallStatus{BATTCTL_ERR_CALL_FAILED, static_cast<uint32_t>(kr)};
    }
    return CallStatus{};
}

} // namespace battctl
