/**
 * @file battctl_c_api.h
 * @brief C interface consumed by the menu bar application
 *
 * All functions are safe to call from any thread. battctl_init() must be
 * called once before the others; they return BATTCTL_ERR_INVALID_STATE or
 * BATTCTL_CONTROL_FAILED otherwise.
 */

#ifndef BATTCTL_C_API_H
#define BATTCTL_C_API_H

#include <stdbool.h>
#include <stddef.h>

#include "battctl_err.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
    BATTCTL_CONTROL_SUCCESS = 0,
    BATTCTL_CONTROL_FAILED,
    BATTCTL_CONTROL_REQUIRES_ELEVATED_PRIVILEGE,
    BATTCTL_CONTROL_NOT_SUPPORTED,
    BATTCTL_CONTROL_AGENT_UNAVAILABLE,
} battctl_control_status_t;

typedef struct {
    int    charge_percent;
    bool   is_charging;
    bool   is_plugged_in;
    bool   has_temperature;
    double temperature_c;
    bool   has_cycle_count;
    int    cycle_count;
    double health_ratio;
} battctl_battery_status_t;

/**
 * @brief Creates the process wide service
 *
 * @param socket_path Agent socket, NULL for the default path
 */
battctl_err_t battctl_init(const char *socket_path);

void battctl_deinit(void);

battctl_err_t battctl_get_battery_status(battctl_battery_status_t *out_status);

/// Returns false when the limit cannot be read
bool battctl_get_charge_limit(int *out_percent);

/**
 * @brief Applies a charge limit, through the agent when needed
 *
 * @param message     Optional buffer receiving a NUL terminated explanation
 * @param message_len Size of message in bytes
 */
battctl_control_status_t battctl_request_charge_limit(int percent, char *message, size_t message_len);

battctl_control_status_t battctl_request_charging_enabled(bool enabled, char *message, size_t message_len);

#ifdef __cplusplus
}
#endif

#endif // BATTCTL_C_API_H
