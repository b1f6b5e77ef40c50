/**
 * @file battctl_err.h
 * @brief Error codes shared by every battctl component
 */

#ifndef BATTCTL_ERR_H
#define BATTCTL_ERR_H

#ifdef __cplusplus
extern "C" {
#endif

typedef int battctl_err_t;

#define BATTCTL_OK                      0
#define BATTCTL_FAIL                    -1

#define BATTCTL_ERR_BASE                0x100
#define BATTCTL_ERR_INVALID_ARG         (BATTCTL_ERR_BASE + 0x01)
#define BATTCTL_ERR_INVALID_STATE       (BATTCTL_ERR_BASE + 0x02)
#define BATTCTL_ERR_INVALID_SIZE        (BATTCTL_ERR_BASE + 0x03)
#define BATTCTL_ERR_TYPE_MISMATCH       (BATTCTL_ERR_BASE + 0x04)
#define BATTCTL_ERR_NOT_FOUND           (BATTCTL_ERR_BASE + 0x05)
#define BATTCTL_ERR_NOT_OPEN            (BATTCTL_ERR_BASE + 0x06)
#define BATTCTL_ERR_SERVICE_NOT_FOUND   (BATTCTL_ERR_BASE + 0x07)
#define BATTCTL_ERR_OPEN_FAILED         (BATTCTL_ERR_BASE + 0x08)
#define BATTCTL_ERR_CALL_FAILED         (BATTCTL_ERR_BASE + 0x09)
#define BATTCTL_ERR_TIMEOUT             (BATTCTL_ERR_BASE + 0x0A)
#define BATTCTL_ERR_NO_MEM              (BATTCTL_ERR_BASE + 0x0B)
#define BATTCTL_ERR_NOT_SUPPORTED       (BATTCTL_ERR_BASE + 0x0C)
#define BATTCTL_ERR_PERMISSION          (BATTCTL_ERR_BASE + 0x0D)
#define BATTCTL_ERR_AGENT_UNAVAILABLE   (BATTCTL_ERR_BASE + 0x0E)
#define BATTCTL_ERR_PROTOCOL            (BATTCTL_ERR_BASE + 0x0F)
#define BATTCTL_ERR_AUTH                (BATTCTL_ERR_BASE + 0x10)
#define BATTCTL_ERR_IO                  (BATTCTL_ERR_BASE + 0x11)

/**
 * @brief Returns a static, human readable name for an error code
 *
 * Unknown codes map to "UNKNOWN_ERROR". Never returns NULL.
 */
const char *battctl_err_to_name(battctl_err_t code);

#ifdef __cplusplus
}
#endif

#endif // BATTCTL_ERR_H
