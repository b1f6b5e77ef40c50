/**
 * @file smc_session.cpp
 * @brief Call translation shared by every SMC transport
 */

#include "smc_session.hpp"

#include <algorithm>
#include <cstring>

#include "battctl_log.h"

namespace battctl {

namespace {
const char *TAG = "smc_session";
} // namespace

const char *smc_command_name(SmcCommand command)
{
    switch (command) {
        case SmcCommand::ReadKey:
            return "read_key";
        case SmcCommand::WriteKey:
            return "write_key";
        case SmcCommand::GetKeyCount:
            return "get_key_count";
        case SmcCommand::GetKeyFromIndex:
            return "get_key_from_index";
        case SmcCommand::GetKeyInfo:
            return "get_key_info";
    }
    return "unknown";
}

CallStatus SmcSession::call(SmcCommand command, smc_param_struct_t &input, smc_param_struct_t &output)
{
    if (!is_connected()) {
        return CallStatus{BATTCTL_ERR_NOT_OPEN, 0};
    }

    calls_.fetch_add(1, std::memory_order_relaxed);
    input.data8 = static_cast<uint8_t>(command);
    std::memset(&output, 0, sizeof(output));

    CallStatus status = do_call(input, output);
    if (!status) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        BATTCTL_LOGW(TAG, "%s failed: %s (os status 0x%08x)",
                     smc_command_name(command), battctl_err_to_name(status.err), status.os_status);
        return status;
    }

    if (output.result == SMC_RESULT_KEY_NOT_FOUND) {
        not_found_.fetch_add(1, std::memory_order_relaxed);
        return CallStatus{BATTCTL_ERR_NOT_FOUND, output.result};
    }
    if (output.result != SMC_RESULT_SUCCESS) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        BATTCTL_LOGW(TAG, "%s rejected by controller: result 0x%02x",
                     smc_command_name(command), output.result);
        return CallStatus{BATTCTL_ERR_CALL_FAILED, output.result};
    }

    return CallStatus{};
}

CallStatus SmcSession::read_key_info(RegisterKey key, RegisterInfo &info)
{
    smc_param_struct_t input{};
    smc_param_struct_t output{};
    input.key = key.code();

    CallStatus status = call(SmcCommand::GetKeyInfo, input, output);
    if (!status) {
        return status;
    }

    info.data_size = output.key_info.data_size;
    info.type_code = output.key_info.data_type;
    info.type = register_type_from_code(output.key_info.data_type);
    info.attributes = output.key_info.data_attributes;
    return status;
}

CallStatus SmcSession::read_key(RegisterKey key, RegisterValue &value)
{
    RegisterInfo info;
    CallStatus status = read_key_info(key, info);
    if (!status) {
        return status;
    }
    if (info.data_size > constants::kSmcDataSize) {
        return CallStatus{BATTCTL_ERR_INVALID_SIZE, 0};
    }

    smc_param_struct_t input{};
    smc_param_struct_t output{};
    input.key = key.code();
    input.key_info.data_size = info.data_size;

    status = call(SmcCommand::ReadKey, input, output);
    if (!status) {
        return status;
    }

    value = RegisterValue{};
    value.type = info.type;
    value.length = info.data_size;
    std::copy_n(output.bytes, info.data_size, value.bytes.begin());
    return status;
}

CallStatus SmcSession::write_key(RegisterKey key, const RegisterValue &value)
{
    if (value.length == 0 || value.length > constants::kSmcDataSize) {
        return CallStatus{BATTCTL_ERR_INVALID_SIZE, 0};
    }

    smc_param_struct_t input{};
    smc_param_struct_t output{};
    input.key = key.code();
    input.key_info.data_size = static_cast<uint32_t>(value.length);
    std::copy(value.bytes.begin(), value.bytes.end(), input.bytes);

    return call(SmcCommand::WriteKey, input, output);
}

SmcSession::Stats SmcSession::get_stats() const
{
    return Stats{
        calls_.load(std::memory_order_relaxed),
        failures_.load(std::memory_order_relaxed),
        not_found_.load(std::memory_order_relaxed),
    };
}

} // namespace battctl
