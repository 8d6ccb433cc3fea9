/*
 * modbus_hw.h
 *
 * Project: Solar Display Controller
 * Purpose: Modbus TCP client (one connection)
 *
 * Notes:
 *  - Implemented per platform (Linux: libmodbus TCP context)
 *  - Only the two functions the controller needs:
 *      0x04 read input registers
 *      0x06 write single register
 *  - Every call is bounded by its timeout
 *
 * Updated: 2026-10-19
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#define MODBUS_READ_MAX_REGS        125

typedef enum {
    MODBUS_OK = 0,
    MODBUS_ERR_TRANSPORT,       /* socket refused, reset, closed */
    MODBUS_ERR_TIMEOUT,         /* no complete answer in time */
    MODBUS_ERR_SYNC,            /* answer belongs to another request */
    MODBUS_ERR_FRAME,           /* malformed response */
    MODBUS_ERR_EXCEPTION        /* device answered with an exception */
} modbus_status_t;

/* Transport-class errors invalidate the connection */
static inline bool modbus_status_is_transport(modbus_status_t st)
{
    return st == MODBUS_ERR_TRANSPORT || st == MODBUS_ERR_TIMEOUT ||
           st == MODBUS_ERR_SYNC;
}

static inline const char *modbus_status_string(modbus_status_t st)
{
    switch (st) {
    case MODBUS_OK:            return "ok";
    case MODBUS_ERR_TRANSPORT: return "transport";
    case MODBUS_ERR_TIMEOUT:   return "timeout";
    case MODBUS_ERR_SYNC:      return "out of sync";
    case MODBUS_ERR_FRAME:     return "frame";
    case MODBUS_ERR_EXCEPTION: return "exception";
    default:                   return "?";
    }
}

/*
 * Open the connection.
 *
 * Any previous connection is closed first.
 * Returns false on resolve, refuse or timeout.
 */
bool modbus_hw_connect(const char *host, uint16_t port, uint32_t timeout_ms);

void modbus_hw_close(void);

bool modbus_hw_is_open(void);

/*
 * Read count input registers from one unit.
 *
 * Returns:
 *  - MODBUS_OK            out holds count words
 *  - MODBUS_ERR_TRANSPORT not open, send/recv failed or peer closed
 *  - MODBUS_ERR_TIMEOUT   no answer within timeout_ms
 *  - MODBUS_ERR_SYNC      transaction or unit id does not match
 *  - MODBUS_ERR_FRAME     bad arguments or malformed answer
 *  - MODBUS_ERR_EXCEPTION device exception, code in *exception (may be NULL)
 */
modbus_status_t modbus_hw_read_input(uint8_t unit, uint16_t addr, uint16_t count,
                                     uint16_t *out, uint32_t timeout_ms,
                                     uint8_t *exception);

/* Write one holding register; same results as modbus_hw_read_input */
modbus_status_t modbus_hw_write_register(uint8_t unit, uint16_t addr, uint16_t value,
                                         uint32_t timeout_ms, uint8_t *exception);
