/**
 * @file iokit_smc_session.hpp
 * @brief AppleSMC transport over the IOKit user client (macOS only)
 */

#pragma once

#include <IOKit/IOKitLib.h>

#include "smc_session.hpp"

namespace battctl {

class IokitSmcSession final : public SmcSession {
public:
    IokitSmcSession() = default;
    ~IokitSmcSession() override;

    IokitSmcSession(const IokitSmcSession &) = delete;
    IokitSmcSession &operator=(const IokitSmcSession &) = delete;

    bool connect() override;
    void disconnect() override;
    bool is_connected() const override { return connection_ != IO_OBJECT_NULL; }

protected:
    CallStatus do_call(const smc_param_struct_t &input, smc_param_struct_t &output) override;

private:
    io_connect_t connection_{IO_OBJECT_NULL};
};

} // namespace battctl
