/*
 * device_link.h
 *
 * Project: Solar Display Controller
 * Purpose: Persistent Modbus TCP link to the Cerbo GX
 *
 * Responsibilities:
 *  - Own the single connection and its state
 *  - Acquire one full telemetry snapshot per call
 *  - Write relay registers on request
 *  - Detect silent links (watchdog) and force a rebuild
 *
 * Invariants:
 *  - Never retries inside a call
 *  - A cycle is bounded by link_timeout_ms
 *  - Transport failure closes the socket; the next poll reconnects
 *  - Decode failure keeps the socket open
 *
 * Notes:
 *  - Reads host, port and timing from g_cfg at link_init()
 *  - Control thread only
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

#include "telemetry.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
    LINK_DISCONNECTED = 0,
    LINK_CONNECTING,
    LINK_CONNECTED,
    LINK_STALE
} link_state_t;

typedef enum {
    LINK_OK = 0,
    LINK_ERR_TRANSPORT,
    LINK_ERR_DECODE,
    LINK_ERR_NOT_CONNECTED
} link_result_t;

/* --------------------------------------------------------------------------
 * Public API
 * -------------------------------------------------------------------------- */

/*
 * Initialize link state.
 *
 * - Does not connect; the first acquire does
 */
void link_init(void);

/*
 * One read cycle over the fixed register batch.
 *
 * Behavior:
 *  - Connects first if Disconnected or Stale
 *  - LINK_OK: *out fully populated, acquired_ms = now_ms
 *  - Otherwise *out untouched
 */
link_result_t link_acquire_snapshot(uint32_t now_ms, struct telemetry_snapshot *out);

/*
 * Write one relay register (0 or 1).
 *
 * - Requires Connected; never connects on its own
 */
link_result_t link_write_relay(relay_id_t relay, bool on, uint32_t now_ms);

/*
 * Watchdog service.
 *
 * If Connected and nothing succeeded for longer than watchdog_ms
 * (counted from the later of last success and connect time),
 * the link goes Stale and the socket is closed.
 */
void link_tick(uint32_t now_ms);

/* Non-blocking state query */
link_state_t link_get_state(void);

/* Close the socket (shutdown path) */
void link_shutdown(void);

const char *link_state_string(link_state_t state);
const char *link_result_string(link_result_t result);

#ifdef __cplusplus
}
#endif
