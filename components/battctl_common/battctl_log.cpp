/**
 * @file battctl_log.cpp
 * @brief syslog sink for the BATTCTL_LOGx macros
 */

#include "battctl_log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <syslog.h>

namespace {

std::atomic<int> s_level{BATTCTL_LOG_INFO};
std::atomic<bool> s_mirror_stderr{false};
std::mutex s_stderr_mutex;

int to_syslog_priority(battctl_log_level_t level)
{
    switch (level) {
        case BATTCTL_LOG_ERROR:
            return LOG_ERR;
        case BATTCTL_LOG_WARN:
            return LOG_WARNING;
        case BATTCTL_LOG_INFO:
            return LOG_INFO;
        case BATTCTL_LOG_DEBUG:
        default:
            return LOG_DEBUG;
    }
}

char level_letter(battctl_log_level_t level)
{
    switch (level) {
        case BATTCTL_LOG_ERROR:
            return 'E';
        case BATTCTL_LOG_WARN:
            return 'W';
        case BATTCTL_LOG_INFO:
            return 'I';
        default:
            return 'D';
    }
}

} // namespace

extern "C" {

void battctl_log_init(const char *ident, bool mirror_stderr)
{
    openlog(ident != nullptr ? ident : "battctl", LOG_PID | LOG_NDELAY, LOG_DAEMON);
    s_mirror_stderr.store(mirror_stderr, std::memory_order_relaxed);
}

void battctl_log_set_level(battctl_log_level_t level)
{
    s_level.store(level, std::memory_order_relaxed);
}

battctl_log_level_t battctl_log_get_level(void)
{
    return static_cast<battctl_log_level_t>(s_level.load(std::memory_order_relaxed));
}

bool battctl_log_level_from_name(const char *name, battctl_log_level_t *out_level)
{
    if (name == nullptr || out_level == nullptr) {
        return false;
    }

    struct Entry {
        const char *name;
        battctl_log_level_t level;
    };
    static const Entry kLevels[] = {
        {"none", BATTCTL_LOG_NONE},
        {"error", BATTCTL_LOG_ERROR},
        {"warn", BATTCTL_LOG_WARN},
        {"info", BATTCTL_LOG_INFO},
        {"debug", BATTCTL_LOG_DEBUG},
    };

    for (const auto &entry : kLevels) {
        if (std::strcmp(entry.name, name) == 0) {
            *out_level = entry.level;
            return true;
        }
    }
    return false;
}

void battctl_log_write(battctl_log_level_t level, const char *tag, const char *format, ...)
{
    char message[512];

    va_list args;
    va_start(args, format);
    std::vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    const char *safe_tag = tag != nullptr ? tag : "-";
    syslog(to_syslog_priority(level), "%s: %s", safe_tag, message);

    if (s_mirror_stderr.load(std::memory_order_relaxed)) {
        std::lock_guard<std::mutex> lock(s_stderr_mutex);
        std::fprintf(stderr, "%c (%s) %s\n", level_letter(level), safe_tag, message);
    }
}

} // extern "C"
