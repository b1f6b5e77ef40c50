/**
 * @file smc_protocol.h
 * @brief AppleSMC user client wire format
 *
 * Every exchange with the SMC is one struct-in/struct-out call on user client
 * method 2. The selector travels in data8, the key in key, and payloads in
 * the fixed 32 byte bytes[] area.
 */

#ifndef SMC_PROTOCOL_H
#define SMC_PROTOCOL_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define SMC_SERVICE_NAME            "AppleSMC"
#define SMC_USER_CLIENT_METHOD      2u
#define SMC_DATA_SIZE               32u

#define SMC_CMD_READ_KEY            5u
#define SMC_CMD_WRITE_KEY           6u
#define SMC_CMD_GET_KEY_COUNT       7u
#define SMC_CMD_GET_KEY_FROM_INDEX  8u
#define SMC_CMD_GET_KEY_INFO        9u

#define SMC_RESULT_SUCCESS          0x00u
#define SMC_RESULT_ERROR            0x01u
#define SMC_RESULT_KEY_NOT_FOUND    0x84u

typedef struct {
    uint8_t  major;
    uint8_t  minor;
    uint8_t  build;
    uint8_t  reserved;
    uint16_t release;
} smc_version_t;

typedef struct {
    uint16_t version;
    uint16_t length;
    uint32_t cpu_p_limit;
    uint32_t gpu_p_limit;
    uint32_t mem_p_limit;
} smc_p_limit_data_t;

typedef struct {
    uint32_t data_size;
    uint32_t data_type;
    uint8_t  data_attributes;
} smc_key_info_t;

typedef struct {
    uint32_t           key;
    smc_version_t      vers;
    smc_p_limit_data_t p_limit_data;
    smc_key_info_t     key_info;
    uint8_t            result;
    uint8_t            status;
    uint8_t            data8;
    uint32_t           data32;
    uint8_t            bytes[SMC_DATA_SIZE];
} smc_param_struct_t;

#ifdef __cplusplus
}

static_assert(sizeof(smc_param_struct_t) == 80, "AppleSMC expects an 80 byte parameter block");
#endif

#endif // SMC_PROTOCOL_H
