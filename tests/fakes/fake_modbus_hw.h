/*
 * fake_modbus_hw.h
 *
 * Project: Solar Display Controller
 * Purpose: Simulated Cerbo GX behind the Modbus transport
 *
 * Notes:
 *  - Register table keyed by (unit, address)
 *  - Unknown registers answer with exception 0x02 like the real device
 *  - Relay writes update the table, so the next read reflects them
 *
 * Updated: 2026-10-19
 */

#pragma once

#include <stdint.h>
#include <string>
#include <vector>

#include "modbus_hw.h"

struct fake_modbus_write {
    uint8_t  unit;
    uint16_t addr;
    uint16_t value;
};

/* Reset to a healthy installation with default values */
void     fake_modbus_reset(void);

void     fake_modbus_set_reg(uint8_t unit, uint16_t addr, uint16_t value);
uint16_t fake_modbus_get_reg(uint8_t unit, uint16_t addr);
void     fake_modbus_remove_reg(uint8_t unit, uint16_t addr);

/* Device unplugged: connects fail, open connections break */
void     fake_modbus_set_reachable(bool reachable);

/* Only this host accepts connections ("" = any) */
void     fake_modbus_set_only_host(const std::string &host);

/* Writes answered with an exception */
void     fake_modbus_set_write_exception(bool on);

/* Every answer carries the wrong transaction id */
void     fake_modbus_set_bad_tid(bool on);

/* Uptime added per request */
void     fake_modbus_set_latency(uint32_t ms);

int      fake_modbus_connect_count(void);
int      fake_modbus_request_count(void);
bool     fake_modbus_is_open(void);

const std::vector<std::string>        &fake_modbus_connect_hosts(void);
const std::vector<fake_modbus_write>  &fake_modbus_writes(void);
