/*
 * controller.h
 *
 * Project: Solar Display Controller
 * Purpose: Fixed-period control loop
 *
 * Responsibilities:
 *  - Poll the device link once per tick
 *  - Debounce inputs and drive the screen cursor
 *  - Turn confirmed switch changes into relay writes
 *  - Refresh the forecast cache at its own cadence
 *  - Render and flush one frame per tick
 *
 * Phases:
 *  - SYNC: wait until both switches match the reported relays
 *          (skipped after CTRL_SYNC_SKIP_TICKS failed polls)
 *  - RUN : normal operation
 *
 * Notes:
 *  - Single control thread; all state is private to controller.cpp
 *  - A link failure never stops the loop
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

#include "telemetry.h"
#include "display/screen_render.h"

#define CTRL_SYNC_SKIP_TICKS    10

typedef enum {
    CTRL_PHASE_SYNC = 0,
    CTRL_PHASE_RUN
} ctrl_phase_t;

/*
 * Reset all controller state and the device link.
 *
 * - Inputs must already be initialized (initial positions are read)
 */
void controller_init(uint32_t now_ms);

/*
 * Fast path, every loop pass (20 ms).
 *
 * - Samples the button; a recognised press advances the cursor
 *   and redraws immediately
 */
void controller_poll(uint32_t now_ms);

/* One full control tick */
void controller_tick(uint32_t now_ms);

/* Close the link and blank the panel */
void controller_shutdown(void);

/* --------------------------------------------------------------------------
 * Inspection
 * -------------------------------------------------------------------------- */

uint8_t      controller_get_cursor(void);
ctrl_phase_t controller_get_phase(void);

/* Latest snapshot, false if none was ever acquired */
bool controller_get_snapshot(struct telemetry_snapshot *out);

/* Snapshot older than snapshot_max_age_ms, or none */
bool controller_snapshot_stale(uint32_t now_ms);

/* Text and overlay of the last rendered frame */
void      controller_get_text(struct screen_text *out);
overlay_t controller_get_overlay(void);
bool      controller_get_status_alert(void);
