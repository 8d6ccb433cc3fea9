/*
 * switch_state_machine.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Hold-to-confirm toggle switch state machine
 */

#include "switch_state_machine.h"

#include <string.h>

/* --------------------------------------------------------------------------
 * Public API
 * -------------------------------------------------------------------------- */

void switch_sm_init(struct switch_sm *sm, bool position)
{
    memset(sm, 0, sizeof(*sm));

    sm->state     = SWITCH_IDLE;
    sm->accepted  = position;
    sm->requested = position;
}

void switch_sm_sample(struct switch_sm *sm, bool position,
                      uint32_t now_ms, uint32_t confirm_ms)
{
    switch (sm->state) {

    case SWITCH_REVERTED:
        sm->state = SWITCH_IDLE;
        /* fall through */

    case SWITCH_IDLE:
        if (position != sm->accepted) {
            sm->requested = position;
            sm->t0_ms     = now_ms;
            sm->state     = SWITCH_PENDING;
        }
        break;

    case SWITCH_PENDING:
        if (position != sm->requested) {
            /* back to the accepted position: discard */
            sm->requested = sm->accepted;
            sm->state     = SWITCH_REVERTED;
            break;
        }

        if ((uint32_t)(now_ms - sm->t0_ms) >= confirm_ms) {
            sm->accepted = sm->requested;
            sm->event    = true;
            sm->state    = SWITCH_CONFIRMED;
        }
        break;

    case SWITCH_CONFIRMED:
    default:
        /* waits for switch_sm_rearm() */
        break;
    }
}

bool switch_sm_take_confirmed(struct switch_sm *sm, bool *position)
{
    if (!sm->event)
        return false;

    sm->event = false;
    *position = sm->accepted;
    return true;
}

void switch_sm_rearm(struct switch_sm *sm, bool position)
{
    sm->state     = SWITCH_IDLE;
    sm->accepted  = position;
    sm->requested = position;
    sm->event     = false;
}

switch_state_t switch_sm_get_state(const struct switch_sm *sm)
{
    return sm->state;
}

uint32_t switch_sm_remaining_ms(const struct switch_sm *sm,
                                uint32_t now_ms, uint32_t confirm_ms)
{
    if (sm->state != SWITCH_PENDING)
        return 0;

    uint32_t held = (uint32_t)(now_ms - sm->t0_ms);
    return (held >= confirm_ms) ? 0 : confirm_ms - held;
}

const char *switch_sm_state_string(switch_state_t state)
{
    switch (state) {
    case SWITCH_IDLE:      return "IDLE";
    case SWITCH_PENDING:   return "PENDING";
    case SWITCH_CONFIRMED: return "CONFIRMED";
    case SWITCH_REVERTED:  return "REVERTED";
    default:               return "UNKNOWN";
    }
}
