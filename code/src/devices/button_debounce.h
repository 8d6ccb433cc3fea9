/*
 * button_debounce.h
 *
 * Project: Solar Display Controller
 * Purpose: Screen-cycle push button debouncer
 *
 * Notes:
 *  - Level-sampled on every fast poll (20 ms)
 *  - Level changes inside the refractory period are ignored
 *  - One press is reported on release
 *  - Holding the button at startup does not count as a press
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

struct button_debounce {
    bool     level;        /* last accepted level, true = pressed */
    bool     armed;        /* accepted press waiting for release */
    bool     has_edge;
    uint32_t edge_ms;      /* time of last accepted edge */
};

void button_init(struct button_debounce *b, bool level);

/*
 * Feed one level sample.
 *
 * Returns:
 *  - true exactly once per recognised press (on release)
 */
bool button_sample(struct button_debounce *b, bool level,
                   uint32_t now_ms, uint32_t refractory_ms);
