/*
 * register_decode.h
 *
 * Project: Solar Display Controller
 * Purpose: Raw register words to typed telemetry
 *
 * Notes:
 *  - Pure functions, no I/O
 *  - Physically impossible values are decode failures:
 *      SoC > 100 %, SoH > 100.0 %, battery state > 2, relay not 0/1
 *
 * Updated: 2026-10-13
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

#include "register_map.h"
#include "telemetry.h"

/*
 * Decode one acquisition cycle.
 *
 * Returns:
 *  - true  and a fully populated *out
 *  - false if any value is out of range (*out untouched)
 */
bool decode_snapshot(const struct raw_regs *raw, uint32_t now_ms,
                     struct telemetry_snapshot *out);

/* Relay register word to state; false unless 0 or 1 */
bool decode_relay(uint16_t word, bool *on);

/* Two's complement register word */
static inline int16_t decode_s16(uint16_t word)
{
    return (int16_t)word;
}
