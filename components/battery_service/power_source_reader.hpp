/**
 * @file power_source_reader.hpp
 * @brief Unprivileged battery state as reported by the power management service
 */

#pragma once

#include "battctl_err.h"

namespace battctl {

struct PowerSourceSnapshot {
    int current_capacity{0};
    int max_capacity{0};
    bool is_charging{false};
    bool is_plugged_in{false};
};

class PowerSourceReader {
public:
    virtual ~PowerSourceReader() = default;

    /// BATTCTL_ERR_NOT_FOUND when the machine has no internal battery
    virtual battctl_err_t read(PowerSourceSnapshot &snapshot) = 0;
};

} // namespace battctl
