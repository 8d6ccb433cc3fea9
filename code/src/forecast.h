/*
 * forecast.h
 *
 * Project: Solar Display Controller
 * Purpose: Sunshine forecast cache
 *
 * Notes:
 *  - Files are written by the cron forecast script:
 *      <dir>/.sonneheute
 *      <dir>/.sonnemorgen
 *      <dir>/.sonneuebermorgen   hours, one decimal
 *      <dir>/.datum              fetch stamp text
 *  - Fetch epoch is the modification time of .datum
 *  - Cache is replaced wholesale on every load
 *
 * Updated: 2026-10-14
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#define FORECAST_DAYS       3
#define FORECAST_STAMP_MAX  24

typedef enum {
    FORECAST_TODAY = 0,
    FORECAST_TOMORROW,
    FORECAST_DAY_AFTER
} forecast_day_t;

struct forecast_cache {
    bool     day_valid[FORECAST_DAYS];
    uint16_t hours_dh[FORECAST_DAYS];     /* 0.1 h */

    bool     stamp_valid;
    char     stamp[FORECAST_STAMP_MAX];
    uint32_t fetched_epoch;               /* 0 = unknown */
};

/*
 * Parse one hours file ("7.5", " 12\n", "3.25").
 *
 * - Rounded to tenths
 * - Rejects negative, empty or trailing garbage
 */
bool forecast_parse_hours(const char *text, uint16_t *out_dh);

/*
 * Reload the cache from dir.
 *
 * Returns:
 *  - true if at least one value was read
 *  - false if nothing usable was found (cache cleared)
 */
bool forecast_load(const char *dir, struct forecast_cache *fc);

/* Fetched within max_age_s of now_epoch */
bool forecast_is_fresh(const struct forecast_cache *fc,
                       uint32_t now_epoch, uint32_t max_age_s);
