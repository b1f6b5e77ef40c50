/**
 * @file battctl_log.h
 * @brief Tag based logging macros backed by syslog(3)
 *
 * Usage mirrors the rest of the code base:
 *
 *     static const char *TAG = "smc_session";
 *     BATTCTL_LOGW(TAG, "IOServiceOpen failed: 0x%08x", kr);
 *
 * Messages above the runtime threshold are dropped before formatting.
 */

#ifndef BATTCTL_LOG_H
#define BATTCTL_LOG_H

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
    BATTCTL_LOG_NONE = 0,
    BATTCTL_LOG_ERROR,
    BATTCTL_LOG_WARN,
    BATTCTL_LOG_INFO,
    BATTCTL_LOG_DEBUG,
} battctl_log_level_t;

/**
 * @brief Opens the syslog connection under the given identity
 *
 * @param ident           Program name reported to syslog (must outlive the process)
 * @param mirror_stderr   Also print every accepted message on stderr
 */
void battctl_log_init(const char *ident, bool mirror_stderr);

void battctl_log_set_level(battctl_log_level_t level);
battctl_log_level_t battctl_log_get_level(void);

/**
 * @brief Parses "error", "warn", "info", "debug" or "none"
 *
 * @return true when the name is known, out_level is left untouched otherwise
 */
bool battctl_log_level_from_name(const char *name, battctl_log_level_t *out_level);

void battctl_log_write(battctl_log_level_t level, const char *tag, const char *format, ...)
    __attribute__((format(printf, 3, 4)));

#ifdef __cplusplus
}
#endif

#define BATTCTL_LOG_LEVEL(level, tag, format, ...)                               \
    do {                                                                         \
        if ((level) <= battctl_log_get_level()) {                                \
            battctl_log_write((level), (tag), format, ##__VA_ARGS__);            \
        }                                                                        \
    } while (0)

#define BATTCTL_LOGE(tag, format, ...) BATTCTL_LOG_LEVEL(BATTCTL_LOG_ERROR, tag, format, ##__VA_ARGS__)
#define BATTCTL_LOGW(tag, format, ...) BATTCTL_LOG_LEVEL(BATTCTL_LOG_WARN, tag, format, ##__VA_ARGS__)
#define BATTCTL_LOGI(tag, format, ...) BATTCTL_LOG_LEVEL(BATTCTL_LOG_INFO, tag, format, ##__VA_ARGS__)
#define BATTCTL_LOGD(tag, format, ...) BATTCTL_LOG_LEVEL(BATTCTL_LOG_DEBUG, tag, format, ##__VA_ARGS__)

#endif // BATTCTL_LOG_H
