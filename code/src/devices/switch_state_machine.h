/*
 * switch_state_machine.h
 *
 * Project: Solar Display Controller
 * Purpose: Hold-to-confirm toggle switch state machine
 *
 * Responsibilities:
 *  - Track the accepted position of one toggle switch
 *  - Require a continuous hold before a change is accepted
 *  - Emit exactly one confirmed event per accepted change
 *
 * Invariants:
 *  - A revert before expiry discards the change silently
 *  - CONFIRMED holds until the owner re-arms the switch
 *  - REVERTED lasts one sample, then IDLE
 *
 * Notes:
 *  - Sampled once per controller tick
 *  - No hardware access; positions come from the caller
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
    SWITCH_IDLE = 0,
    SWITCH_PENDING,      /* new position held, window running */
    SWITCH_CONFIRMED,    /* window expired, event ready */
    SWITCH_REVERTED      /* switched back inside the window */
} switch_state_t;

struct switch_sm {
    switch_state_t state;
    bool           accepted;     /* position the relay should follow */
    bool           requested;    /* position held while PENDING */
    uint32_t       t0_ms;        /* start of the hold */
    bool           event;        /* confirmed event not yet taken */
};

/*
 * Initialize with the current physical position.
 *
 * - No event is produced for the initial position
 */
void switch_sm_init(struct switch_sm *sm, bool position);

/*
 * Feed one sample.
 *
 * Parameters:
 *  - position   : physical switch position (true = ON)
 *  - now_ms     : uptime
 *  - confirm_ms : continuous hold required
 */
void switch_sm_sample(struct switch_sm *sm, bool position,
                      uint32_t now_ms, uint32_t confirm_ms);

/*
 * Take the confirmed event.
 *
 * Returns:
 *  - true once per confirmation, *position = accepted position
 */
bool switch_sm_take_confirmed(struct switch_sm *sm, bool *position);

/*
 * Return to IDLE tracking the given position.
 *
 * - Called after the relay write, with the actual switch position
 */
void switch_sm_rearm(struct switch_sm *sm, bool position);

switch_state_t switch_sm_get_state(const struct switch_sm *sm);

/* Time left in the window, 0 unless PENDING */
uint32_t switch_sm_remaining_ms(const struct switch_sm *sm,
                                uint32_t now_ms, uint32_t confirm_ms);

const char *switch_sm_state_string(switch_state_t state);

#ifdef __cplusplus
}
#endif
