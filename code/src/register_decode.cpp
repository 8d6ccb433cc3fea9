/*
 * register_decode.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Raw register words to typed telemetry
 *
 * Notes:
 *  - PV power words above 60000 are small negative readings
 *    from the DC meter at night and decode as 0 W
 *
 * Updated: 2026-10-13
 */

#include "register_decode.h"
#include "console/mini_printf.h"

#include <string.h>

#define SOC_MAX_PCT       100u
#define SOH_MAX_DPCT      1000u
#define PV_NEGATIVE_MIN   60001u

const char *relay_name(relay_id_t relay)
{
    switch (relay) {
    case RELAY_GENERATOR: return "Generator";
    case RELAY_MULTIPLUS: return "Multiplus II";
    default:              return "?";
    }
}

bool decode_relay(uint16_t word, bool *on)
{
    if (word > 1)
        return false;

    *on = (word == 1);
    return true;
}

bool decode_snapshot(const struct raw_regs *raw, uint32_t now_ms,
                     struct telemetry_snapshot *out)
{
    struct telemetry_snapshot s;
    memset(&s, 0, sizeof(s));

    s.acquired_ms = now_ms;

    /* ---- battery block ---- */
    uint16_t soc   = raw->battery[BATTERY_IDX_SOC];
    uint16_t state = raw->battery[BATTERY_IDX_STATE];

    if (soc > SOC_MAX_PCT) {
        mini_printf("[MODBUS] decode: SoC %u out of range\n", (unsigned)soc);
        return false;
    }

    if (state > BATT_DISCHARGING) {
        mini_printf("[MODBUS] decode: battery state %u out of range\n", (unsigned)state);
        return false;
    }

    s.batt_voltage_dv = raw->battery[BATTERY_IDX_VOLTAGE];
    s.batt_power_w    = decode_s16(raw->battery[BATTERY_IDX_POWER]);
    s.soc_pct         = (uint8_t)soc;
    s.batt_state      = (batt_state_t)state;

    /* ---- loads and PV ---- */
    for (int i = 0; i < REG_AC_LOAD_COUNT; i++)
        s.ac_load_w += raw->ac_load[i];

    s.pv_power_w = (raw->pv_power >= PV_NEGATIVE_MIN) ? 0 : raw->pv_power;

    /* ---- relays ---- */
    bool mp_on;
    if (!decode_relay(raw->relay_multiplus, &mp_on)) {
        mini_printf("[MODBUS] decode: multiplus relay %u invalid\n",
                    (unsigned)raw->relay_multiplus);
        return false;
    }

    if (!decode_relay(raw->relay_generator, &s.generator_on)) {
        mini_printf("[MODBUS] decode: generator relay %u invalid\n",
                    (unsigned)raw->relay_generator);
        return false;
    }

    s.inverter = mp_on ? INVERTER_ON : INVERTER_OFF;

    /* ---- battery monitor ---- */
    if (raw->soh > SOH_MAX_DPCT) {
        mini_printf("[MODBUS] decode: SoH %u out of range\n", (unsigned)raw->soh);
        return false;
    }
    s.soh_dpct = raw->soh;

    /* ---- chargers ---- */
    for (uint8_t i = 0; i < raw->yield_count && i < CONFIG_MAX_YIELD_UNITS; i++)
        s.yield_dkwh += raw->yield[i];

    *out = s;
    return true;
}
