/**
 * @file iops_power_source_reader.hpp
 * @brief PowerSourceReader backed by IOPowerSources (macOS only)
 */

#pragma once

#include "power_source_reader.hpp"

namespace battctl {

class IopsPowerSourceReader final : public PowerSourceReader {
public:
    battctl_err_t read(PowerSourceSnapshot &snapshot) override;
};

} // namespace battctl
