/*
 * modbus_tcp_linux.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Modbus TCP client over libmodbus
 *
 * Notes:
 *  - One modbus_t context, recreated on every connect
 *  - The unit id is set per request (modbus_set_slave)
 *  - The response timeout is set from the caller's budget before
 *    every call; libmodbus also bounds connect() with it
 *  - Error recovery stays off: a bad answer is reported, the link
 *    layer decides whether to drop the connection
 *
 * Updated: 2026-10-19
 */

#include "modbus_hw.h"
#include "console/mini_printf.h"

#include <errno.h>
#include <stdio.h>

#include <modbus.h>

static modbus_t *g_ctx = NULL;

/* --------------------------------------------------------------------------
 * Helpers
 * -------------------------------------------------------------------------- */

static void set_timeout(uint32_t timeout_ms)
{
    modbus_set_response_timeout(g_ctx, timeout_ms / 1000, (timeout_ms % 1000) * 1000);
}

/* Map errno after a failed libmodbus call */
static modbus_status_t status_from_errno(int err, uint8_t *exception)
{
    if (err >= EMBXILFUN && err <= EMBXGTAR) {
        if (exception)
            *exception = (uint8_t)(err - MODBUS_ENOBASE);
        return MODBUS_ERR_EXCEPTION;
    }

    switch (err) {
    case ETIMEDOUT:
        return MODBUS_ERR_TIMEOUT;
    case EMBBADDATA:        /* transaction id or length mismatch */
    case EMBBADSLAVE:
        return MODBUS_ERR_SYNC;
    case EMBBADCRC:
    case EMBBADEXC:
    case EMBMDATA:
    case EINVAL:
        return MODBUS_ERR_FRAME;
    default:
        return MODBUS_ERR_TRANSPORT;
    }
}

static modbus_status_t begin_request(uint8_t unit, uint32_t timeout_ms)
{
    if (!g_ctx)
        return MODBUS_ERR_TRANSPORT;

    if (modbus_set_slave(g_ctx, unit) != 0)
        return MODBUS_ERR_FRAME;

    set_timeout(timeout_ms);
    return MODBUS_OK;
}

/* --------------------------------------------------------------------------
 * Public API
 * -------------------------------------------------------------------------- */

bool modbus_hw_connect(const char *host, uint16_t port, uint32_t timeout_ms)
{
    char service[8];

    modbus_hw_close();

    snprintf(service, sizeof(service), "%u", (unsigned)port);

    g_ctx = modbus_new_tcp_pi(host, service);
    if (!g_ctx) {
        mini_printf("[MODBUS] context for %s failed: %s\n", host, modbus_strerror(errno));
        return false;
    }

    set_timeout(timeout_ms);

    if (modbus_connect(g_ctx) != 0) {
        modbus_free(g_ctx);
        g_ctx = NULL;
        return false;
    }

    return true;
}

void modbus_hw_close(void)
{
    if (!g_ctx)
        return;

    modbus_close(g_ctx);
    modbus_free(g_ctx);
    g_ctx = NULL;
}

bool modbus_hw_is_open(void)
{
    return g_ctx != NULL;
}

modbus_status_t modbus_hw_read_input(uint8_t unit, uint16_t addr, uint16_t count,
                                     uint16_t *out, uint32_t timeout_ms,
                                     uint8_t *exception)
{
    if (!out || count == 0 || count > MODBUS_READ_MAX_REGS)
        return MODBUS_ERR_FRAME;

    modbus_status_t st = begin_request(unit, timeout_ms);
    if (st != MODBUS_OK)
        return st;

    int n = modbus_read_input_registers(g_ctx, addr, count, out);
    if (n == (int)count)
        return MODBUS_OK;

    if (n >= 0)
        return MODBUS_ERR_FRAME;

    return status_from_errno(errno, exception);
}

modbus_status_t modbus_hw_write_register(uint8_t unit, uint16_t addr, uint16_t value,
                                         uint32_t timeout_ms, uint8_t *exception)
{
    modbus_status_t st = begin_request(unit, timeout_ms);
    if (st != MODBUS_OK)
        return st;

    if (modbus_write_register(g_ctx, addr, value) == 1)
        return MODBUS_OK;

    return status_from_errno(errno, exception);
}
