/**
 * @file cjson_utils.hpp
 * @brief Ownership helpers for cJSON trees and printed buffers
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "cJSON.h"

namespace battctl {

struct CJsonDeleter {
    void operator()(cJSON *ptr) const noexcept
    {
        if (ptr) {
            cJSON_Delete(ptr);
        }
    }
};
using UniqueCJson = std::unique_ptr<cJSON, CJsonDeleter>;

struct CStringDeleter {
    void operator()(char *ptr) const noexcept
    {
        if (ptr) {
            cJSON_free(ptr);
        }
    }
};
using UniqueCString = std::unique_ptr<char, CStringDeleter>;

/// Unformatted rendering, nullopt when cJSON runs out of memory
inline std::optional<std::string> print_json(const cJSON *node, bool formatted = false)
{
    UniqueCString text(formatted ? cJSON_Print(node) : cJSON_PrintUnformatted(node));
    if (!text) {
        return std::nullopt;
    }
    return std::string(text.get());
}

} // namespace battctl
