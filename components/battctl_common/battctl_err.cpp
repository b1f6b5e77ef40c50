/**
 * @file battctl_err.cpp
 * @brief Error code names
 */

#include "battctl_err.h"

#include <array>

namespace {

struct ErrName {
    battctl_err_t code;
    const char *name;
};

#define BATTCTL_ERR_NAME(code) ErrName{code, #code}

constexpr std::array<ErrName, 19> kErrNames = {{
    BATTCTL_ERR_NAME(BATTCTL_OK),
    BATTCTL_ERR_NAME(BATTCTL_FAIL),
    BATTCTL_ERR_NAME(BATTCTL_ERR_INVALID_ARG),
    BATTCTL_ERR_NAME(BATTCTL_ERR_INVALID_STATE),
    BATTCTL_ERR_NAME(BATTCTL_ERR_INVALID_SIZE),
    BATTCTL_ERR_NAME(BATTCTL_ERR_TYPE_MISMATCH),
    BATTCTL_ERR_NAME(BATTCTL_ERR_NOT_FOUND),
    BATTCTL_ERR_NAME(BATTCTL_ERR_NOT_OPEN),
    BATTCTL_ERR_NAME(BATTCTL_ERR_SERVICE_NOT_FOUND),
    BATTCTL_ERR_NAME(BATTCTL_ERR_OPEN_FAILED),
    BATTCTL_ERR_NAME(BATTCTL_ERR_CALL_FAILED),
    BATTCTL_ERR_NAME(BATTCTL_ERR_TIMEOUT),
    BATTCTL_ERR_NAME(BATTCTL_ERR_NO_MEM),
    BATTCTL_ERR_NAME(BATTCTL_ERR_NOT_SUPPORTED),
    BATTCTL_ERR_NAME(BATTCTL_ERR_PERMISSION),
    BATTCTL_ERR_NAME(BATTCTL_ERR_AGENT_UNAVAILABLE),
    BATTCTL_ERR_NAME(BATTCTL_ERR_PROTOCOL),
    BATTCTL_ERR_NAME(BATTCTL_ERR_AUTH),
    BATTCTL_ERR_NAME(BATTCTL_ERR_IO),
}};

#undef BATTCTL_ERR_NAME

} // namespace

extern "C" const char *battctl_err_to_name(battctl_err_t code)
{
    for (const auto &entry : kErrNames) {
        if (entry.code == code) {
            return entry.name;
        }
    }
    return "UNKNOWN_ERROR";
}
