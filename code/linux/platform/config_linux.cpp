/*
 * config_linux.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Linux configuration persistence
 *
 * Notes:
 *  - Uses shared defaults, then applies the JSON file
 *  - forecast_dir falls back to $HOME
 *
 * Updated: 2026-10-15
 */

#include "config.h"
#include "file_io.h"
#include "console/mini_printf.h"

#include <stdlib.h>
#include <string.h>

static void apply_home(struct config *cfg)
{
    if (cfg->forecast_dir[0])
        return;

    const char *home = getenv("HOME");
    if (!home || strlen(home) >= sizeof(cfg->forecast_dir))
        return;

    strcpy(cfg->forecast_dir, home);
}

bool config_load(const char *path, struct config *cfg)
{
    static char text[CONFIG_TEXT_MAX];

    config_defaults(cfg);

    if (!file_read_text(path, text, sizeof(text), NULL)) {
        /* No saved config: start from defaults */
        mini_printf("[CONFIG] %s not readable, using defaults\n", path);
        apply_home(cfg);
        return false;
    }

    bool ok = config_parse_json(text, cfg);
    if (!ok) {
        mini_printf("[CONFIG] %s malformed, using defaults\n", path);
        config_defaults(cfg);
    } else {
        mini_printf("[CONFIG] %s loaded, site %L, %L\n", path,
                    cfg->latitude_e4, cfg->longitude_e4);
    }

    apply_home(cfg);
    return ok;
}

bool config_save(const char *path, const struct config *cfg)
{
    static char text[CONFIG_TEXT_MAX];

    if (!config_format_json(cfg, text, sizeof(text))) {
        mini_printf("[CONFIG] format overflow\n");
        return false;
    }

    if (!file_write_text(path, text)) {
        mini_printf("[CONFIG] write %s failed\n", path);
        return false;
    }

    mini_printf("[CONFIG] saved %s\n", path);
    return true;
}
