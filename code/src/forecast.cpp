/*
 * forecast.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Sunshine forecast cache
 */

#include "forecast.h"
#include "file_io.h"
#include "config.h"
#include "console/mini_printf.h"

#include <string.h>

#define FORECAST_FILE_MAX   64
#define FORECAST_HOURS_MAX  240     /* 24.0 h */

static const char *const k_day_files[FORECAST_DAYS] = {
    ".sonneheute",
    ".sonnemorgen",
    ".sonneuebermorgen",
};

static const char *const k_stamp_file = ".datum";

static bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static void join_path(char *out, size_t cap, const char *dir, const char *name)
{
    size_t n = strlen(dir);

    if (n > 0 && dir[n - 1] == '/')
        mini_snprintf(out, cap, "%s%s", dir, name);
    else
        mini_snprintf(out, cap, "%s/%s", dir, name);
}

bool forecast_parse_hours(const char *text, uint16_t *out_dh)
{
    const char *p = text;

    while (is_space(*p))
        p++;

    if (*p < '0' || *p > '9')
        return false;

    uint32_t whole = 0;
    while (*p >= '0' && *p <= '9') {
        whole = whole * 10 + (uint32_t)(*p - '0');
        if (whole * 10 > FORECAST_HOURS_MAX)
            return false;
        p++;
    }

    uint32_t tenths = 0;
    uint32_t round  = 0;

    /* decimal point or comma (locale of the fetch script) */
    if (*p == '.' || *p == ',') {
        p++;
        if (*p >= '0' && *p <= '9') {
            tenths = (uint32_t)(*p - '0');
            p++;
        }
        if (*p >= '0' && *p <= '9') {
            round = (*p >= '5') ? 1 : 0;
            p++;
        }
        while (*p >= '0' && *p <= '9')
            p++;
    }

    while (is_space(*p))
        p++;

    if (*p != '\0')
        return false;

    uint32_t dh = whole * 10 + tenths + round;
    if (dh > FORECAST_HOURS_MAX)
        return false;

    *out_dh = (uint16_t)dh;
    return true;
}

bool forecast_load(const char *dir, struct forecast_cache *fc)
{
    char path[CONFIG_PATH_MAX + 24];
    char text[FORECAST_FILE_MAX];
    bool any = false;

    memset(fc, 0, sizeof(*fc));

    for (int i = 0; i < FORECAST_DAYS; i++) {
        join_path(path, sizeof(path), dir, k_day_files[i]);

        if (!file_read_text(path, text, sizeof(text), NULL)) {
            mini_printf("[FORECAST] %s missing\n", path);
            continue;
        }

        if (!forecast_parse_hours(text, &fc->hours_dh[i])) {
            mini_printf("[FORECAST] %s unreadable\n", path);
            continue;
        }

        fc->day_valid[i] = true;
        any = true;
    }

    join_path(path, sizeof(path), dir, k_stamp_file);

    uint32_t mtime = 0;
    if (file_read_text(path, text, sizeof(text), &mtime)) {
        /* first line, trimmed */
        const char *s = text;
        while (is_space(*s))
            s++;

        size_t n = 0;
        while (s[n] && s[n] != '\n' && s[n] != '\r' && n + 1 < sizeof(fc->stamp)) {
            fc->stamp[n] = s[n];
            n++;
        }
        while (n > 0 && is_space(fc->stamp[n - 1]))
            n--;
        fc->stamp[n] = '\0';

        fc->stamp_valid   = (n > 0);
        fc->fetched_epoch = mtime;
    } else {
        mini_printf("[FORECAST] %s missing\n", path);
    }

    return any;
}

bool forecast_is_fresh(const struct forecast_cache *fc,
                       uint32_t now_epoch, uint32_t max_age_s)
{
    if (fc->fetched_epoch == 0)
        return false;

    /* clock stepped backwards */
    if (now_epoch < fc->fetched_epoch)
        return true;

    return (now_epoch - fc->fetched_epoch) <= max_age_s;
}
