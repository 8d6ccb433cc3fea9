/*
 * screen_render.h
 *
 * Project: Solar Display Controller
 * Purpose: Screen composition and rendering
 *
 * Responsibilities:
 *  - Turn the current model into four text lines (pure)
 *  - Draw lines, border and status cell with U8g2
 *
 * Layout:
 *  - 1 px border around the panel
 *  - Four lines, 16 px pitch, 6x12 font (20 columns)
 *  - Top-right status cell (x 113..124, y 2..15), filled with an
 *    inverted '!' when status_alert is set
 *  - Line 0 is limited to SCREEN_COLS_TOP characters to keep the
 *    status cell clear
 *
 * Notes:
 *  - Missing data renders as dashes
 *  - Overlays use the same four-line geometry
 *
 * Updated: 2026-10-19
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

#include <u8g2.h>

#include "telemetry.h"
#include "forecast.h"

#define SCREEN_COUNT        4
#define SCREEN_LINES        4
#define SCREEN_COLS         20
#define SCREEN_COLS_TOP     18

/* From 21:00 the sun is considered gone for today */
#define SCREEN_EVENING_HOUR 21

typedef enum {
    SCREEN_OVERVIEW = 0,
    SCREEN_PV,
    SCREEN_BATTERY,
    SCREEN_SUNSHINE
} screen_id_t;

typedef enum {
    OVERLAY_NONE = 0,
    OVERLAY_SYNC,           /* switch disagrees with relay at startup */
    OVERLAY_PENDING,        /* hold-to-confirm window running */
    OVERLAY_RELAY_FAULT,    /* relay write failed */
    OVERLAY_LAN,            /* nothing read for a watchdog period */
    OVERLAY_MESSAGE         /* free text (discovery) */
} overlay_t;

struct screen_clock {
    int hour;
    int minute;
    int second;
};

struct screen_model {
    uint8_t                          screen;           /* screen_id_t */

    const struct telemetry_snapshot *snap;             /* NULL: dashes */
    bool                             status_alert;

    const struct forecast_cache     *forecast;         /* NULL: dashes */
    bool                             forecast_fresh;

    struct screen_clock              clock;

    overlay_t                        overlay;
    relay_id_t                       relay;            /* SYNC, PENDING, FAULT */
    bool                             relay_on;         /* target position */
    uint8_t                          seconds_left;     /* PENDING */
    const char                      *message[SCREEN_LINES];
};

struct screen_text {
    char line[SCREEN_LINES][SCREEN_COLS + 1];
};

/* Compose the four text lines for a model */
void screen_compose(const struct screen_model *m, struct screen_text *out);

/* Draw composed text into the U8g2 buffer (cleared first) */
void screen_draw(const struct screen_text *text, bool status_alert, u8g2_t *u8g2);

/* Compose and draw */
void screen_render(const struct screen_model *m, u8g2_t *u8g2);
