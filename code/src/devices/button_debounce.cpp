/*
 * button_debounce.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Screen-cycle push button debouncer
 */

#include "button_debounce.h"

void button_init(struct button_debounce *b, bool level)
{
    b->level    = level;
    b->armed    = false;
    b->has_edge = false;
    b->edge_ms  = 0;
}

bool button_sample(struct button_debounce *b, bool level,
                   uint32_t now_ms, uint32_t refractory_ms)
{
    if (level == b->level)
        return false;

    /* bounce */
    if (b->has_edge && (uint32_t)(now_ms - b->edge_ms) < refractory_ms)
        return false;

    b->level    = level;
    b->edge_ms  = now_ms;
    b->has_edge = true;

    if (level) {
        b->armed = true;
        return false;
    }

    if (!b->armed)
        return false;

    b->armed = false;
    return true;
}
