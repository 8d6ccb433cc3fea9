/*
 * fake_display_hw.h
 *
 * Project: Solar Display Controller
 * Purpose: Frame capture in place of the OLED
 *
 * Notes:
 *  - Real U8g2 buffer with no-op bus callbacks
 *  - Frames are captured in panel (rotated) coordinates
 */

#pragma once

#include <stdint.h>
#include <vector>

#include "display_hw.h"

/* Set up an unrotated panel and forget captured frames */
void fake_display_reset(void);
int  fake_display_flush_count(void);
bool fake_display_blanked(void);

/* Pixel of the last flushed frame */
bool fake_display_pixel(int x, int y);
const std::vector<uint8_t> &fake_display_last_frame(void);
