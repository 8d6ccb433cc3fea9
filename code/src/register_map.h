/*
 * register_map.h
 *
 * Project: Solar Display Controller
 * Purpose: Cerbo GX Modbus TCP register map
 *
 * Notes:
 *  - Reads use function 0x04 (input registers)
 *  - Relay writes use 0x06 on the address the state is read from
 *  - Unit ids are the Cerbo's fixed service mapping
 *
 * Updated: 2026-10-13
 */

#pragma once

#include <stdint.h>
#include "telemetry.h"
#include "config.h"

/* --------------------------------------------------------------------------
 * Unit ids
 * -------------------------------------------------------------------------- */
#define REG_UNIT_SYSTEM         100
#define REG_UNIT_BATTERY        225

/* --------------------------------------------------------------------------
 * System (unit 100)
 * -------------------------------------------------------------------------- */

/* 840 voltage (0.1 V), 841 current, 842 power (W, signed),
   843 SoC (%), 844 state (0 idle, 1 charging, 2 discharging) */
#define REG_BATTERY_BASE        840
#define REG_BATTERY_COUNT       5

#define BATTERY_IDX_VOLTAGE     0
#define BATTERY_IDX_CURRENT     1
#define BATTERY_IDX_POWER       2
#define BATTERY_IDX_SOC         3
#define BATTERY_IDX_STATE       4

/* AC consumption L1..L3 (W) */
#define REG_AC_LOAD_BASE        817
#define REG_AC_LOAD_COUNT       3

/* PV on DC bus (W) */
#define REG_PV_POWER            850

/* Relay states, 0/1 */
#define REG_RELAY_MULTIPLUS     807     /* relay 2 */
#define REG_RELAY_GENERATOR     3500    /* relay 3 */

/* Discovery probe */
#define REG_PROBE               800

/* --------------------------------------------------------------------------
 * Battery monitor (unit 225)
 * -------------------------------------------------------------------------- */
#define REG_BATTERY_SOH         304     /* 0.1 % */

/* --------------------------------------------------------------------------
 * Solar chargers (unit id per charger, from config)
 * -------------------------------------------------------------------------- */
#define REG_YIELD_TODAY         784     /* 0.1 kWh */

/* Register address holding (and switching) a relay */
static inline uint16_t register_relay_address(relay_id_t relay)
{
    return (relay == RELAY_GENERATOR) ? REG_RELAY_GENERATOR
                                      : REG_RELAY_MULTIPLUS;
}

/* Raw register words of one acquisition cycle */
struct raw_regs {
    uint16_t battery[REG_BATTERY_COUNT];
    uint16_t ac_load[REG_AC_LOAD_COUNT];
    uint16_t pv_power;
    uint16_t relay_multiplus;
    uint16_t relay_generator;
    uint16_t soh;
    uint16_t yield[CONFIG_MAX_YIELD_UNITS];
    uint8_t  yield_count;
};
