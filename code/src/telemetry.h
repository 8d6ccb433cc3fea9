/*
 * telemetry.h
 *
 * Project: Solar Display Controller
 * Purpose: Telemetry snapshot value type
 *
 * Notes:
 *  - Produced once per successful poll cycle
 *  - Fully populated or not produced at all
 *  - Fixed-point integers only
 *
 * Updated: 2026-10-13
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

typedef enum {
    BATT_IDLE        = 0,
    BATT_CHARGING    = 1,
    BATT_DISCHARGING = 2
} batt_state_t;

typedef enum {
    INVERTER_OFF = 0,
    INVERTER_ON  = 1
} inverter_state_t;

/* Relays controlled by the toggle switches */
typedef enum {
    RELAY_GENERATOR = 0,
    RELAY_MULTIPLUS,
    RELAY_COUNT
} relay_id_t;

struct telemetry_snapshot {
    uint32_t         acquired_ms;       /* uptime at acquisition */

    uint16_t         pv_power_w;
    uint8_t          soc_pct;           /* 0..100 */
    int16_t          batt_power_w;      /* + charging, - discharging */
    batt_state_t     batt_state;
    uint16_t         batt_voltage_dv;   /* 0.1 V */
    uint32_t         ac_load_w;         /* L1 + L2 + L3 */

    bool             generator_on;
    inverter_state_t inverter;

    uint16_t         soh_dpct;          /* 0.1 % */
    uint32_t         yield_dkwh;        /* 0.1 kWh, all chargers */
};

const char *relay_name(relay_id_t relay);
