/**
 * @file control_result.hpp
 * @brief Outcome of a battery control operation
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace battctl {

enum class ControlStatus : uint8_t {
    Success,
    Failed,
    RequiresElevatedPrivilege,
    NotSupported,
    AgentUnavailable,
};

inline const char *control_status_name(ControlStatus status)
{
    switch (status) {
        case ControlStatus::Success:
            return "success";
        case ControlStatus::Failed:
            return "failed";
        case ControlStatus::RequiresElevatedPrivilege:
            return "requires_elevated_privilege";
        case ControlStatus::NotSupported:
            return "not_supported";
        case ControlStatus::AgentUnavailable:
            return "agent_unavailable";
    }
    return "unknown";
}

inline std::optional<ControlStatus> control_status_from_name(std::string_view name)
{
    for (ControlStatus status : {ControlStatus::Success, ControlStatus::Failed,
                                 ControlStatus::RequiresElevatedPrivilege, ControlStatus::NotSupported,
                                 ControlStatus::AgentUnavailable}) {
        if (name == control_status_name(status)) {
            return status;
        }
    }
    return std::nullopt;
}

struct ControlResult {
    ControlStatus status{ControlStatus::Failed};
    std::string message;

    static ControlResult success(std::string message = {})
    {
        return ControlResult{ControlStatus::Success, std::move(message)};
    }
    static ControlResult failed(std::string message) { return ControlResult{ControlStatus::Failed, std::move(message)}; }
    static ControlResult requires_privilege()
    {
        return ControlResult{ControlStatus::RequiresElevatedPrivilege, "Root privileges required"};
    }
    static ControlResult not_supported(std::string message)
    {
        return ControlResult{ControlStatus::NotSupported, std::move(message)};
    }
    static ControlResult agent_unavailable(std::string message)
    {
        return ControlResult{ControlStatus::AgentUnavailable, std::move(message)};
    }

    explicit operator bool() const { return status == ControlStatus::Success; }
};

} // namespace battctl
