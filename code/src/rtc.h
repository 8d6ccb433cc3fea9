/*
 * rtc.h
 *
 * Project: Solar Display Controller
 * Purpose: Wall clock access
 *
 * Notes:
 *  - Local time, as configured on the board
 *  - Used for the on-screen clock, the evening forecast rule
 *    and forecast age only. Never for state machine timing.
 *
 * Updated: 2026-10-13
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

/* Local calendar time */
void rtc_get_time(int *year, int *month, int *day,
                  int *hour, int *minute, int *second);

/* Seconds since the Unix epoch (UTC) */
uint32_t rtc_epoch(void);
