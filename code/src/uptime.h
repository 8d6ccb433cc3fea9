/*
 * uptime.h
 *
 * Project: Solar Display Controller
 * Purpose: Monotonic time base
 *
 * Notes:
 *  - All state machine timing is expressed in uptime milliseconds
 *  - Wraps after ~49 days; compare with (uint32_t)(now - t0)
 *
 * Updated: 2026-10-12
 */

#pragma once

#include <stdint.h>

// Initialize uptime timebase.
void uptime_init(void);

// Monotonic seconds since start.
uint32_t uptime_seconds(void);

// Monotonic milliseconds since start.
uint32_t uptime_millis(void);

// Sleep the control thread (main loop pacing only).
void uptime_sleep_ms(uint32_t ms);
