/*
 * config_common.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Configuration defaults, JSON parse and format
 *
 * Notes:
 *  - Platform-agnostic (file I/O lives in the platform layer)
 *  - ArduinoJson 6 documents on the stack, no heap
 *  - Values of unknown keys are ignored whatever their type
 *  - Each known key is range checked on its own; a bad value keeps
 *    the previous setting and is logged
 *  - All fields initialized explicitly in config_defaults()
 *
 * Updated: 2026-10-19
 */

#include "config.h"
#include "console/mini_printf.h"

#include <math.h>
#include <string.h>

#include <ArduinoJson.h>

/* Global runtime configuration */
struct config g_cfg;

/* Parse document: every string of the input may be copied */
#define CONFIG_PARSE_CAPACITY   (2 * CONFIG_TEXT_MAX)
#define CONFIG_FORMAT_CAPACITY  1536

void config_defaults(struct config *cfg)
{
    /* Start from a known baseline */
    memset(cfg, 0, sizeof(*cfg));

    /* ---- Remote device ---- */
    cfg->device_host[0] = '\0';      /* discover on first run */
    cfg->device_port    = 502;

    /* 50.8450°, 7.4830° */
    cfg->latitude_e4  = 508450;
    cfg->longitude_e4 =  74830;

    /* ---- Display: SH1106 on /dev/i2c-1 @ 0x3C, mounted upside down ---- */
    cfg->display_rotation = 2;
    cfg->i2c_bus          = 1;
    cfg->i2c_address      = 0x3C;

    /* ---- GPIO ---- */
    strcpy(cfg->gpio_chip, "/dev/gpiochip0");
    cfg->gpio_generator = 17;
    cfg->gpio_multiplus = 27;
    cfg->gpio_button    = 24;

    /* ---- Timing ---- */
    cfg->poll_period_ms       = 1000;
    cfg->link_timeout_ms      = 5000;
    cfg->watchdog_ms          = 60000;
    cfg->snapshot_max_age_ms  = 10000;
    cfg->switch_confirm_ms    = 5000;
    cfg->button_refractory_ms = 250;
    cfg->forecast_refresh_ms  = 600000;   /* 10 min */
    cfg->forecast_max_age_s   = 86400;    /* 1 day */
    cfg->idle_reset_ticks     = 10;
    cfg->relay_fault_ticks    = 3;

    /* ---- Forecast cache: platform fills in $HOME on load ---- */
    cfg->forecast_dir[0] = '\0';

    /* ---- Solar chargers ---- */
    static const uint8_t units[] = { 238, 239, 226, 224, 223 };
    memcpy(cfg->yield_unit_ids, units, sizeof(units));
    cfg->yield_unit_count = (uint8_t)sizeof(units);

    /* ---- Any future fields MUST be initialized here ---- */
}

/* -------------------------------------------------------------------------- */
/* Value checks                                                               */
/* -------------------------------------------------------------------------- */

static void reject(const char *key)
{
    mini_printf("[CONFIG] ignoring invalid value for \"%s\"\n", key);
}

static bool is_key(const char *key, const char *a, const char *b)
{
    return !strcmp(key, a) || (b && !strcmp(key, b));
}

/* Numbers only; booleans are not numbers here */
static bool to_double(JsonVariant v, double *out)
{
    if (v.is<bool>() || !v.is<double>())
        return false;

    *out = v.as<double>();
    return true;
}

/* Whole number in [min, max]; 5e2 counts as 500 */
static bool to_uint(JsonVariant v, uint32_t min, uint32_t max, uint32_t *out)
{
    double d;

    if (!to_double(v, &d) || d != floor(d))
        return false;

    if (d < (double)min || d > (double)max)
        return false;

    *out = (uint32_t)d;
    return true;
}

/* Degrees to degrees * 10000, rounded */
static bool to_e4(JsonVariant v, int32_t limit_deg, int32_t *out)
{
    double d;

    if (!to_double(v, &d) || fabs(d) > (double)limit_deg)
        return false;

    long e4 = lround(d * 10000.0);
    if (e4 > (long)limit_deg * 10000 || e4 < -(long)limit_deg * 10000)
        return false;

    *out = (int32_t)e4;
    return true;
}

/* "0x3C", "3C" or "60" (decimal only when no hex digits) */
static bool parse_hex_text(const char *s, uint32_t *out)
{
    if (s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
        s += 2;

    if (!*s)
        return false;

    uint32_t v = 0;
    for (; *s; s++) {
        char h = *s;
        v <<= 4;
        if (h >= '0' && h <= '9')      v |= (uint32_t)(h - '0');
        else if (h >= 'a' && h <= 'f') v |= (uint32_t)(h - 'a' + 10);
        else if (h >= 'A' && h <= 'F') v |= (uint32_t)(h - 'A' + 10);
        else return false;

        if (v > 0xFFFF)
            return false;
    }

    *out = v;
    return true;
}

/* -------------------------------------------------------------------------- */
/* Keys                                                                       */
/* -------------------------------------------------------------------------- */

static void apply_string(const char *key, JsonVariant v, bool allow_null,
                         char *out, size_t cap)
{
    if (v.isNull() && allow_null) {
        out[0] = '\0';
        return;
    }

    if (!v.is<const char *>()) {
        reject(key);
        return;
    }

    const char *s = v.as<const char *>();
    if (strlen(s) >= cap) {
        reject(key);
        return;
    }

    strcpy(out, s);
}

static void apply_i2c_address(const char *key, JsonVariant v, struct config *cfg)
{
    uint32_t addr = 0;
    bool ok;

    if (v.is<const char *>())
        ok = parse_hex_text(v.as<const char *>(), &addr) && addr >= 0x03 && addr <= 0x77;
    else
        ok = to_uint(v, 0x03, 0x77, &addr);

    if (ok)
        cfg->i2c_address = (uint8_t)addr;
    else
        reject(key);
}

/* All or nothing: one bad id keeps the previous list */
static void apply_yield_units(const char *key, JsonVariant v, struct config *cfg)
{
    if (!v.is<JsonArray>()) {
        reject(key);
        return;
    }

    JsonArray arr = v.as<JsonArray>();
    uint8_t ids[CONFIG_MAX_YIELD_UNITS];
    uint8_t count = 0;

    for (JsonVariant item : arr) {
        uint32_t id;
        if (count >= CONFIG_MAX_YIELD_UNITS || !to_uint(item, 1, 247, &id)) {
            reject(key);
            return;
        }
        ids[count++] = (uint8_t)id;
    }

    memcpy(cfg->yield_unit_ids, ids, count);
    cfg->yield_unit_count = count;
}

static void apply_key(const char *key, JsonVariant v, struct config *cfg)
{
    /* ---- strings ---- */
    if (is_key(key, "device_host", "cerbo_host")) {
        apply_string(key, v, true, cfg->device_host, sizeof(cfg->device_host));
        return;
    }

    if (is_key(key, "gpio_chip", NULL)) {
        apply_string(key, v, false, cfg->gpio_chip, sizeof(cfg->gpio_chip));
        return;
    }

    if (is_key(key, "forecast_dir", NULL)) {
        apply_string(key, v, true, cfg->forecast_dir, sizeof(cfg->forecast_dir));
        return;
    }

    /* ---- location ---- */
    if (is_key(key, "latitude", NULL)) {
        if (!to_e4(v, 90, &cfg->latitude_e4))
            reject(key);
        return;
    }

    if (is_key(key, "longitude", NULL)) {
        if (!to_e4(v, 180, &cfg->longitude_e4))
            reject(key);
        return;
    }

    if (is_key(key, "i2c_address", NULL)) {
        apply_i2c_address(key, v, cfg);
        return;
    }

    if (is_key(key, "yield_unit_ids", NULL)) {
        apply_yield_units(key, v, cfg);
        return;
    }

    /* ---- integers ---- */
    struct {
        const char *name;
        const char *alias;
        uint32_t    min;
        uint32_t    max;
        uint8_t     width;   /* bytes */
        void       *field;
    } ints[] = {
        { "device_port",          "cerbo_port",     1,    65535,      2, &cfg->device_port },
        { "display_rotation",     "display_rotate", 0,    2,          1, &cfg->display_rotation },
        { "i2c_bus",              "i2c_port",       0,    255,        1, &cfg->i2c_bus },
        { "gpio_generator",       NULL,             0,    255,        1, &cfg->gpio_generator },
        { "gpio_multiplus",       NULL,             0,    255,        1, &cfg->gpio_multiplus },
        { "gpio_button",          NULL,             0,    255,        1, &cfg->gpio_button },
        { "poll_period_ms",       NULL,             100,  60000,      4, &cfg->poll_period_ms },
        { "link_timeout_ms",      NULL,             100,  30000,      4, &cfg->link_timeout_ms },
        { "watchdog_ms",          NULL,             1000, 3600000,    4, &cfg->watchdog_ms },
        { "snapshot_max_age_ms",  NULL,             1000, 3600000,    4, &cfg->snapshot_max_age_ms },
        { "switch_confirm_ms",    NULL,             500,  60000,      4, &cfg->switch_confirm_ms },
        { "button_refractory_ms", NULL,             0,    2000,       4, &cfg->button_refractory_ms },
        { "forecast_refresh_ms",  NULL,             1000, 86400000,   4, &cfg->forecast_refresh_ms },
        { "forecast_max_age_s",   NULL,             60,   604800,     4, &cfg->forecast_max_age_s },
        { "idle_reset_ticks",     NULL,             1,    3600,       2, &cfg->idle_reset_ticks },
        { "relay_fault_ticks",    NULL,             1,    600,        2, &cfg->relay_fault_ticks },
    };

    for (size_t i = 0; i < sizeof(ints) / sizeof(ints[0]); i++) {
        if (!is_key(key, ints[i].name, ints[i].alias))
            continue;

        uint32_t val;
        if (!to_uint(v, ints[i].min, ints[i].max, &val)) {
            reject(key);
            return;
        }

        /* rotation is 0 or 2 only */
        if (ints[i].field == &cfg->display_rotation && val == 1) {
            reject(key);
            return;
        }

        switch (ints[i].width) {
        case 1: *(uint8_t  *)ints[i].field = (uint8_t)val;  break;
        case 2: *(uint16_t *)ints[i].field = (uint16_t)val; break;
        default: *(uint32_t *)ints[i].field = val;          break;
        }
        return;
    }

    /* unknown key: ignored */
}

bool config_parse_json(const char *text, struct config *cfg)
{
    if (!text || !cfg)
        return false;

    StaticJsonDocument<CONFIG_PARSE_CAPACITY> doc;

    DeserializationError err = deserializeJson(doc, text);
    if (err) {
        mini_printf("[CONFIG] JSON error: %s\n", err.c_str());
        return false;
    }

    if (!doc.is<JsonObject>()) {
        mini_printf("[CONFIG] top level is not an object\n");
        return false;
    }

    JsonObject root = doc.as<JsonObject>();
    for (JsonPair kv : root)
        apply_key(kv.key().c_str(), kv.value(), cfg);

    return true;
}

/* -------------------------------------------------------------------------- */
/* Formatting                                                                 */
/* -------------------------------------------------------------------------- */

bool config_format_json(const struct config *cfg, char *buf, size_t cap)
{
    if (!cfg || !buf || cap == 0)
        return false;

    StaticJsonDocument<CONFIG_FORMAT_CAPACITY> doc;
    char addr[8];

    buf[0] = '\0';

    /* empty strings are saved as null */
    if (cfg->device_host[0])
        doc["device_host"] = (const char *)cfg->device_host;
    else
        doc["device_host"] = (const char *)0;

    doc["device_port"]      = cfg->device_port;
    doc["latitude"]         = cfg->latitude_e4 / 10000.0;
    doc["longitude"]        = cfg->longitude_e4 / 10000.0;
    doc["display_rotation"] = cfg->display_rotation;
    doc["i2c_bus"]          = cfg->i2c_bus;

    mini_snprintf(addr, sizeof(addr), "0x%x", (unsigned)cfg->i2c_address);
    doc["i2c_address"] = addr;

    doc["gpio_chip"]      = (const char *)cfg->gpio_chip;
    doc["gpio_generator"] = cfg->gpio_generator;
    doc["gpio_multiplus"] = cfg->gpio_multiplus;
    doc["gpio_button"]    = cfg->gpio_button;

    doc["poll_period_ms"]       = cfg->poll_period_ms;
    doc["link_timeout_ms"]      = cfg->link_timeout_ms;
    doc["watchdog_ms"]          = cfg->watchdog_ms;
    doc["snapshot_max_age_ms"]  = cfg->snapshot_max_age_ms;
    doc["switch_confirm_ms"]    = cfg->switch_confirm_ms;
    doc["button_refractory_ms"] = cfg->button_refractory_ms;
    doc["forecast_refresh_ms"]  = cfg->forecast_refresh_ms;
    doc["forecast_max_age_s"]   = cfg->forecast_max_age_s;
    doc["idle_reset_ticks"]     = cfg->idle_reset_ticks;
    doc["relay_fault_ticks"]    = cfg->relay_fault_ticks;

    if (cfg->forecast_dir[0])
        doc["forecast_dir"] = (const char *)cfg->forecast_dir;
    else
        doc["forecast_dir"] = (const char *)0;

    JsonArray units = doc.createNestedArray("yield_unit_ids");
    for (uint8_t i = 0; i < cfg->yield_unit_count; i++)
        units.add(cfg->yield_unit_ids[i]);

    if (doc.overflowed()) {
        mini_printf("[CONFIG] format document full\n");
        return false;
    }

    /* room for the text, a newline and the terminator */
    size_t len = measureJsonPretty(doc);
    if (len + 2 > cap)
        return false;

    serializeJsonPretty(doc, buf, cap);
    buf[len]     = '\n';
    buf[len + 1] = '\0';
    return true;
}
