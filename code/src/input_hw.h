/*
 * input_hw.h
 *
 * Project: Solar Display Controller
 * Purpose: Toggle switch and button inputs
 *
 * Notes:
 *  - Implemented per platform (Linux: GPIO character device)
 *  - Lines are pulled up and active low; read returns logical state
 *    (true = switch ON / button pressed)
 *  - Line offsets come from g_cfg
 *
 * Updated: 2026-10-14
 */

#pragma once

#include <stdbool.h>

typedef enum {
    INPUT_GENERATOR = 0,
    INPUT_MULTIPLUS,
    INPUT_BUTTON,
    INPUT_COUNT
} input_line_t;

/* Request all lines. Must be called once before input_hw_read(). */
bool input_hw_init(void);

bool input_hw_read(input_line_t line, bool *active);

/* Release the lines */
void input_hw_close(void);
