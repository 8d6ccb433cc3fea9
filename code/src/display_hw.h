/*
 * display_hw.h
 *
 * Project: Solar Display Controller
 * Purpose: OLED panel access
 *
 * Notes:
 *  - Implemented per platform (Linux: U8g2 SH1106 driver over i2c-dev)
 *  - Bus and address come from g_cfg
 *  - Drawing goes to the U8g2 full-frame buffer, flush sends it
 *  - Rotation is applied by U8g2 while drawing
 *
 * Updated: 2026-10-19
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

#include <u8g2.h>

/*
 * Set up the driver, open the bus and run the panel init sequence.
 *
 * Parameters:
 *  - rotation : 0 or 2 (180 degrees)
 *
 * The draw buffer is usable even when this returns false; flushes
 * then fail.
 */
bool display_hw_init(uint8_t rotation);

/* Draw target, NULL before display_hw_init */
u8g2_t *display_hw_u8g2(void);

/* Push the full frame */
bool display_hw_flush(void);

/* Clear the panel and switch it off */
void display_hw_blank(void);

void display_hw_close(void);
