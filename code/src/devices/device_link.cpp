/*
 * device_link.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Persistent Modbus TCP link to the Cerbo GX
 */

#include "device_link.h"

#include "config.h"
#include "modbus_hw.h"
#include "register_map.h"
#include "register_decode.h"
#include "uptime.h"
#include "console/mini_printf.h"

#include <string.h>

/* --------------------------------------------------------------------------
 * Internal state
 * -------------------------------------------------------------------------- */

static link_state_t g_state      = LINK_DISCONNECTED;
static uint32_t     g_ref_ms     = 0;     /* later of connect / last success */
static uint32_t     g_deadline   = 0;     /* uptime deadline of current cycle */

/* --------------------------------------------------------------------------
 * Helpers
 * -------------------------------------------------------------------------- */

static void set_state(link_state_t s)
{
    if (g_state == s)
        return;

    mini_printf("[LINK] %s -> %s\n", link_state_string(g_state), link_state_string(s));
    g_state = s;
}

static void drop_connection(void)
{
    modbus_hw_close();
    set_state(LINK_DISCONNECTED);
}

/* Remaining budget of the current cycle, 0 when spent */
static uint32_t budget_left(void)
{
    int32_t left = (int32_t)(g_deadline - uptime_millis());
    return (left > 0) ? (uint32_t)left : 0;
}

static bool ensure_connected(uint32_t now_ms)
{
    if (g_state == LINK_CONNECTED && modbus_hw_is_open())
        return true;

    if (g_state == LINK_STALE)
        modbus_hw_close();

    set_state(LINK_CONNECTING);

    if (!modbus_hw_connect(g_cfg.device_host, g_cfg.device_port, budget_left())) {
        mini_printf("[LINK] transport: connect %s:%u failed\n",
                    g_cfg.device_host, (unsigned)g_cfg.device_port);
        drop_connection();
        return false;
    }

    mini_printf("[LINK] connected %s:%u\n", g_cfg.device_host, (unsigned)g_cfg.device_port);
    g_ref_ms = now_ms;
    set_state(LINK_CONNECTED);
    return true;
}

/* Read count input registers; transport errors drop the link */
static modbus_status_t read_regs(uint8_t unit, uint16_t addr, uint16_t count, uint16_t *out)
{
    uint8_t exc = 0;

    uint32_t left = budget_left();
    if (left == 0) {
        mini_printf("[MODBUS] transport: cycle budget spent before %u/%u\n",
                    (unsigned)addr, (unsigned)unit);
        return MODBUS_ERR_TIMEOUT;
    }

    modbus_status_t st = modbus_hw_read_input(unit, addr, count, out, left, &exc);

    if (st == MODBUS_ERR_EXCEPTION) {
        mini_printf("[MODBUS] decode: reg %u unit %u exception %u\n",
                    (unsigned)addr, (unsigned)unit, (unsigned)exc);
    } else if (st != MODBUS_OK) {
        mini_printf("[MODBUS] %s: reg %u unit %u %s\n",
                    modbus_status_is_transport(st) ? "transport" : "decode",
                    (unsigned)addr, (unsigned)unit, modbus_status_string(st));
    }

    return st;
}

static link_result_t fail_cycle(modbus_status_t st)
{
    if (modbus_status_is_transport(st)) {
        drop_connection();
        return LINK_ERR_TRANSPORT;
    }

    return LINK_ERR_DECODE;
}

/* --------------------------------------------------------------------------
 * Public API
 * -------------------------------------------------------------------------- */

void link_init(void)
{
    g_state    = LINK_DISCONNECTED;
    g_ref_ms   = 0;
    g_deadline = 0;
}

link_result_t link_acquire_snapshot(uint32_t now_ms, struct telemetry_snapshot *out)
{
    g_deadline = uptime_millis() + g_cfg.link_timeout_ms;

    if (!ensure_connected(now_ms))
        return LINK_ERR_TRANSPORT;

    struct raw_regs raw;
    memset(&raw, 0, sizeof(raw));

    modbus_status_t st;

    st = read_regs(REG_UNIT_SYSTEM, REG_BATTERY_BASE, REG_BATTERY_COUNT, raw.battery);
    if (st != MODBUS_OK)
        return fail_cycle(st);

    st = read_regs(REG_UNIT_SYSTEM, REG_AC_LOAD_BASE, REG_AC_LOAD_COUNT, raw.ac_load);
    if (st != MODBUS_OK)
        return fail_cycle(st);

    st = read_regs(REG_UNIT_SYSTEM, REG_PV_POWER, 1, &raw.pv_power);
    if (st != MODBUS_OK)
        return fail_cycle(st);

    st = read_regs(REG_UNIT_SYSTEM, REG_RELAY_MULTIPLUS, 1, &raw.relay_multiplus);
    if (st != MODBUS_OK)
        return fail_cycle(st);

    st = read_regs(REG_UNIT_SYSTEM, REG_RELAY_GENERATOR, 1, &raw.relay_generator);
    if (st != MODBUS_OK)
        return fail_cycle(st);

    st = read_regs(REG_UNIT_BATTERY, REG_BATTERY_SOH, 1, &raw.soh);
    if (st != MODBUS_OK)
        return fail_cycle(st);

    for (uint8_t i = 0; i < g_cfg.yield_unit_count; i++) {
        st = read_regs(g_cfg.yield_unit_ids[i], REG_YIELD_TODAY, 1, &raw.yield[i]);
        if (st != MODBUS_OK)
            return fail_cycle(st);
    }
    raw.yield_count = g_cfg.yield_unit_count;

    if (!decode_snapshot(&raw, now_ms, out))
        return LINK_ERR_DECODE;

    g_ref_ms = now_ms;
    return LINK_OK;
}

link_result_t link_write_relay(relay_id_t relay, bool on, uint32_t now_ms)
{
    if (g_state != LINK_CONNECTED || !modbus_hw_is_open()) {
        mini_printf("[LINK] write %s refused: %s\n",
                    relay_name(relay), link_state_string(g_state));
        return LINK_ERR_NOT_CONNECTED;
    }

    uint8_t  exc = 0;
    uint16_t addr  = register_relay_address(relay);
    uint16_t value = on ? 1 : 0;

    modbus_status_t st = modbus_hw_write_register(REG_UNIT_SYSTEM, addr, value,
                                                  g_cfg.link_timeout_ms, &exc);

    if (st != MODBUS_OK) {
        mini_printf("[MODBUS] write %s reg %u failed: %s %u\n",
                    relay_name(relay), (unsigned)addr, modbus_status_string(st),
                    (unsigned)exc);
        return fail_cycle(st);
    }

    mini_printf("[MODBUS] write %s reg %u = %u\n",
                relay_name(relay), (unsigned)addr, (unsigned)value);

    g_ref_ms = now_ms;
    return LINK_OK;
}

void link_tick(uint32_t now_ms)
{
    if (g_state != LINK_CONNECTED)
        return;

    if ((uint32_t)(now_ms - g_ref_ms) <= g_cfg.watchdog_ms)
        return;

    mini_printf("[LINK] watchdog: silent %lu ms\n", (uint32_t)(now_ms - g_ref_ms));

    modbus_hw_close();
    set_state(LINK_STALE);
}

link_state_t link_get_state(void)
{
    return g_state;
}

void link_shutdown(void)
{
    modbus_hw_close();
    set_state(LINK_DISCONNECTED);
}

const char *link_state_string(link_state_t state)
{
    switch (state) {
    case LINK_DISCONNECTED: return "DISCONNECTED";
    case LINK_CONNECTING:   return "CONNECTING";
    case LINK_CONNECTED:    return "CONNECTED";
    case LINK_STALE:        return "STALE";
    default:                return "UNKNOWN";
    }
}

const char *link_result_string(link_result_t result)
{
    switch (result) {
    case LINK_OK:                return "ok";
    case LINK_ERR_TRANSPORT:     return "transport";
    case LINK_ERR_DECODE:        return "decode";
    case LINK_ERR_NOT_CONNECTED: return "not connected";
    default:                     return "?";
    }
}
