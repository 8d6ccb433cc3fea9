/*
 * config.h
 *
 * Project: Solar Display Controller
 * Purpose: Runtime configuration
 *
 * Notes:
 *  - Stored as a flat JSON object (config.json)
 *  - Unknown keys are ignored, missing keys keep defaults
 *  - Legacy key names (cerbo_host, cerbo_port, i2c_port,
 *    display_rotate) are accepted on load
 *  - Save always writes the current key names
 *
 * Updated: 2026-10-14
 */

#pragma once
#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#define CONFIG_HOST_MAX         64
#define CONFIG_PATH_MAX         128
#define CONFIG_MAX_YIELD_UNITS  8

/* Text buffer large enough for a saved config file */
#define CONFIG_TEXT_MAX         2048

/* Global configuration */
struct config {
    /* ---- Remote device ---- */
    char     device_host[CONFIG_HOST_MAX];   /* "" = run discovery */
    uint16_t device_port;

    /* ---- Location (informative, forecast script input) ---- */
    int32_t  latitude_e4;    /* degrees * 10000 */
    int32_t  longitude_e4;   /* degrees * 10000 */

    /* ---- Display ---- */
    uint8_t  display_rotation;   /* 0 or 2 (180 degrees) */
    uint8_t  i2c_bus;            /* /dev/i2c-N */
    uint8_t  i2c_address;        /* 7-bit */

    /* ---- GPIO (BCM line offsets) ---- */
    char     gpio_chip[CONFIG_PATH_MAX];
    uint8_t  gpio_generator;
    uint8_t  gpio_multiplus;
    uint8_t  gpio_button;

    /* ---- Timing ---- */
    uint32_t poll_period_ms;
    uint32_t link_timeout_ms;        /* per acquisition cycle */
    uint32_t watchdog_ms;            /* max silence while connected */
    uint32_t snapshot_max_age_ms;    /* older snapshot renders as dashes */
    uint32_t switch_confirm_ms;      /* continuous hold window */
    uint32_t button_refractory_ms;
    uint32_t forecast_refresh_ms;
    uint32_t forecast_max_age_s;
    uint16_t idle_reset_ticks;
    uint16_t relay_fault_ticks;

    /* ---- Forecast cache ---- */
    char     forecast_dir[CONFIG_PATH_MAX];

    /* ---- Solar charger unit ids summed for yield today ---- */
    uint8_t  yield_unit_ids[CONFIG_MAX_YIELD_UNITS];
    uint8_t  yield_unit_count;
};

void config_defaults(struct config *cfg);

/*
 * Apply a JSON object to cfg.
 *
 * Behavior:
 *  - Only keys present in the text are changed
 *  - Out-of-range values are rejected per key (logged, default kept)
 *
 * Returns:
 *  - true  if text is a well-formed JSON object
 *  - false on syntax error (cfg may be partially updated)
 */
bool config_parse_json(const char *text, struct config *cfg);

/*
 * Render cfg as a JSON object.
 *
 * Returns:
 *  - true  if the output fit into buf
 */
bool config_format_json(const struct config *cfg, char *buf, size_t cap);

/*
 * Platform persistence.
 *
 * config_load():
 *  - Starts from defaults
 *  - Returns false if the file is missing or malformed
 *    (cfg then holds defaults)
 */
bool config_load(const char *path, struct config *cfg);
bool config_save(const char *path, const struct config *cfg);

extern struct config g_cfg;
