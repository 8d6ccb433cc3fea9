/*
 * controller.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Fixed-period control loop
 *
 * Tick order:
 *  1. acquire snapshot, watchdog
 *  2. poll inputs
 *  3. button press -> cursor
 *  4. idle reset
 *  5. switch sync / confirmed toggles -> relay writes
 *  6. forecast refresh
 *  7. render + flush
 */

#include "controller.h"

#include "config.h"
#include "forecast.h"
#include "rtc.h"
#include "input_hw.h"
#include "display_hw.h"
#include "devices/device_link.h"
#include "devices/switch_state_machine.h"
#include "devices/button_debounce.h"
#include "console/mini_printf.h"

#include <string.h>

/* --------------------------------------------------------------------------
 * Internal state
 * -------------------------------------------------------------------------- */

static ctrl_phase_t              g_phase = CTRL_PHASE_SYNC;

static struct telemetry_snapshot g_snap;
static bool                      g_have_snap  = false;
static uint32_t                  g_last_ok_ms = 0;

static uint8_t                   g_cursor     = 0;
static uint16_t                  g_idle_ticks = 0;

static struct button_debounce    g_button;
static struct switch_sm          g_switch[RELAY_COUNT];
static bool                      g_switch_known[RELAY_COUNT];   /* position read since run */

static uint16_t                  g_sync_fail    = 0;
static relay_id_t                g_sync_relay   = RELAY_GENERATOR;
static bool                      g_sync_target  = false;

static uint16_t                  g_fault_ticks  = 0;
static relay_id_t                g_fault_relay  = RELAY_GENERATOR;

static struct forecast_cache     g_forecast;
static bool                      g_forecast_loaded = false;
static uint32_t                  g_forecast_ms     = 0;

static struct screen_text        g_text;
static overlay_t                 g_overlay      = OVERLAY_NONE;
static bool                      g_alert        = false;
static bool                      g_flush_failed = false;

/* Relay -> input line */
static const input_line_t k_switch_line[RELAY_COUNT] = {
    INPUT_GENERATOR,
    INPUT_MULTIPLUS,
};

/* --------------------------------------------------------------------------
 * Helpers
 * -------------------------------------------------------------------------- */

static bool read_line(input_line_t line, bool *active)
{
    if (input_hw_read(line, active))
        return true;

    mini_printf("[INPUT] read line %u failed\n", (unsigned)line);
    return false;
}

static bool relay_reported(const struct telemetry_snapshot *s, relay_id_t relay)
{
    return (relay == RELAY_GENERATOR) ? s->generator_on
                                      : (s->inverter == INVERTER_ON);
}

static bool snapshot_fresh(uint32_t now_ms)
{
    if (!g_have_snap)
        return false;

    return (uint32_t)(now_ms - g_snap.acquired_ms) <= g_cfg.snapshot_max_age_ms;
}

/* A switch whose line cannot be read stays unarmed until it can */
static void enter_run(void)
{
    for (int i = 0; i < RELAY_COUNT; i++) {
        bool pos = false;
        g_switch_known[i] = read_line(k_switch_line[i], &pos);
        switch_sm_init(&g_switch[i], pos);
    }

    g_phase = CTRL_PHASE_RUN;
}

/* --------------------------------------------------------------------------
 * Rendering
 * -------------------------------------------------------------------------- */

static overlay_t pick_overlay(uint32_t now_ms, struct screen_model *m)
{
    if (g_phase == CTRL_PHASE_SYNC) {
        if (!g_have_snap) {
            m->message[0] = "INITIALISIERUNG";
            m->message[1] = "warte auf Cerbo";
            m->message[2] = g_cfg.device_host;
            return OVERLAY_MESSAGE;
        }

        m->relay    = g_sync_relay;
        m->relay_on = g_sync_target;
        return OVERLAY_SYNC;
    }

    for (int i = 0; i < RELAY_COUNT; i++) {
        if (switch_sm_get_state(&g_switch[i]) != SWITCH_PENDING)
            continue;

        uint32_t left = switch_sm_remaining_ms(&g_switch[i], now_ms,
                                               g_cfg.switch_confirm_ms);
        m->relay        = (relay_id_t)i;
        m->relay_on     = g_switch[i].requested;
        m->seconds_left = (uint8_t)((left + 999) / 1000);
        return OVERLAY_PENDING;
    }

    if (g_fault_ticks > 0) {
        m->relay = g_fault_relay;
        return OVERLAY_RELAY_FAULT;
    }

    if ((uint32_t)(now_ms - g_last_ok_ms) > g_cfg.watchdog_ms)
        return OVERLAY_LAN;

    return OVERLAY_NONE;
}

static void render(uint32_t now_ms)
{
    struct screen_model m;
    memset(&m, 0, sizeof(m));

    bool fresh = snapshot_fresh(now_ms);

    m.screen         = g_cursor;
    m.snap           = fresh ? &g_snap : NULL;
    m.status_alert   = !fresh || link_get_state() != LINK_CONNECTED;
    m.forecast       = g_forecast_loaded ? &g_forecast : NULL;
    m.forecast_fresh = g_forecast_loaded &&
                       forecast_is_fresh(&g_forecast, rtc_epoch(), g_cfg.forecast_max_age_s);

    int y, mo, d;
    rtc_get_time(&y, &mo, &d, &m.clock.hour, &m.clock.minute, &m.clock.second);

    m.overlay = pick_overlay(now_ms, &m);

    screen_compose(&m, &g_text);

    if (m.overlay != g_overlay)
        mini_printf("[DISPLAY] overlay %u -> %u\n", (unsigned)g_overlay, (unsigned)m.overlay);

    g_overlay = m.overlay;
    g_alert   = m.status_alert;

    u8g2_t *u8g2 = display_hw_u8g2();
    if (!u8g2)
        return;

    screen_draw(&g_text, m.status_alert, u8g2);

    if (!display_hw_flush()) {
        if (!g_flush_failed)
            mini_printf("[DISPLAY] flush failed\n");
        g_flush_failed = true;
    } else {
        g_flush_failed = false;
    }
}

/* --------------------------------------------------------------------------
 * Tick steps
 * -------------------------------------------------------------------------- */

/* Returns true if a press was recognised */
static bool poll_button(uint32_t now_ms)
{
    bool level = false;

    if (!input_hw_read(INPUT_BUTTON, &level))
        return false;

    if (!button_sample(&g_button, level, now_ms, g_cfg.button_refractory_ms))
        return false;

    g_cursor     = (uint8_t)((g_cursor + 1) % SCREEN_COUNT);
    g_idle_ticks = 0;

    mini_printf("[INPUT] button -> screen %u\n", (unsigned)g_cursor);
    return true;
}

static void step_idle(bool pressed)
{
    if (pressed)
        return;

    if (g_idle_ticks < g_cfg.idle_reset_ticks)
        g_idle_ticks++;

    if (g_idle_ticks >= g_cfg.idle_reset_ticks && g_cursor != 0) {
        mini_printf("[CTRL] idle, back to screen 0\n");
        g_cursor = 0;
    }
}

static void step_sync(bool polled)
{
    if (!polled) {
        if (++g_sync_fail >= CTRL_SYNC_SKIP_TICKS) {
            mini_printf("[CTRL] sync skipped: no data for %u ticks\n",
                        (unsigned)g_sync_fail);
            enter_run();
        }
        return;
    }

    g_sync_fail = 0;

    for (int i = 0; i < RELAY_COUNT; i++) {
        bool pos;
        if (!read_line(k_switch_line[i], &pos))
            return;

        bool reported = relay_reported(&g_snap, (relay_id_t)i);
        if (pos != reported) {
            g_sync_relay  = (relay_id_t)i;
            g_sync_target = reported;
            return;
        }
    }

    mini_printf("[CTRL] switches in sync\n");
    enter_run();
}

static void step_switches(uint32_t now_ms)
{
    for (int i = 0; i < RELAY_COUNT; i++) {
        relay_id_t relay = (relay_id_t)i;
        bool pos;

        if (!read_line(k_switch_line[i], &pos))
            continue;

        if (!g_switch_known[i]) {
            mini_printf("[INPUT] %s at %s, armed\n", relay_name(relay), pos ? "AN" : "AUS");
            switch_sm_init(&g_switch[i], pos);
            g_switch_known[i] = true;
            continue;
        }

        switch_state_t before = switch_sm_get_state(&g_switch[i]);
        switch_sm_sample(&g_switch[i], pos, now_ms, g_cfg.switch_confirm_ms);
        switch_state_t after = switch_sm_get_state(&g_switch[i]);

        if (before != after)
            mini_printf("[INPUT] %s %s -> %s (%s)\n", relay_name(relay),
                        switch_sm_state_string(before), switch_sm_state_string(after),
                        pos ? "AN" : "AUS");

        bool target;
        if (!switch_sm_take_confirmed(&g_switch[i], &target))
            continue;

        mini_printf("[CTRL] %s confirmed %s\n", relay_name(relay), target ? "AN" : "AUS");

        link_result_t r = link_write_relay(relay, target, now_ms);
        if (r != LINK_OK) {
            mini_printf("[CTRL] %s write failed: %s\n", relay_name(relay), link_result_string(r));
            g_fault_relay = relay;
            g_fault_ticks = g_cfg.relay_fault_ticks;
        }

        switch_sm_rearm(&g_switch[i], pos);
    }
}

static void step_forecast(uint32_t now_ms)
{
    if (g_forecast_loaded &&
        (uint32_t)(now_ms - g_forecast_ms) < g_cfg.forecast_refresh_ms)
        return;

    g_forecast_ms = now_ms;

    if (!g_cfg.forecast_dir[0]) {
        g_forecast_loaded = false;
        return;
    }

    (void)forecast_load(g_cfg.forecast_dir, &g_forecast);
    g_forecast_loaded = true;
}

/* --------------------------------------------------------------------------
 * Public API
 * -------------------------------------------------------------------------- */

void controller_init(uint32_t now_ms)
{
    g_phase        = CTRL_PHASE_SYNC;
    g_have_snap    = false;
    g_last_ok_ms   = now_ms;
    g_cursor       = 0;
    g_idle_ticks   = 0;
    g_sync_fail    = 0;
    g_sync_relay   = RELAY_GENERATOR;
    g_sync_target  = false;
    g_fault_ticks  = 0;
    g_overlay      = OVERLAY_NONE;
    g_alert        = false;
    g_flush_failed = false;

    g_forecast_loaded = false;
    g_forecast_ms     = 0;

    memset(&g_snap, 0, sizeof(g_snap));
    memset(&g_forecast, 0, sizeof(g_forecast));
    memset(&g_text, 0, sizeof(g_text));

    bool level = false;
    if (!read_line(INPUT_BUTTON, &level))
        level = false;
    button_init(&g_button, level);

    /* switches are read when the run phase starts */
    for (int i = 0; i < RELAY_COUNT; i++) {
        switch_sm_init(&g_switch[i], false);
        g_switch_known[i] = false;
    }

    link_init();

    mini_printf("[CTRL] init, device %s:%u\n", g_cfg.device_host, (unsigned)g_cfg.device_port);
}

void controller_poll(uint32_t now_ms)
{
    if (poll_button(now_ms)) {
        g_idle_ticks = 0;
        render(now_ms);
    }
}

void controller_tick(uint32_t now_ms)
{
    /* ---- 1. telemetry ---- */
    struct telemetry_snapshot snap;
    link_result_t r = link_acquire_snapshot(now_ms, &snap);

    if (r == LINK_OK) {
        g_snap       = snap;
        g_have_snap  = true;
        g_last_ok_ms = now_ms;
    }

    link_tick(now_ms);

    /* ---- 2..4. inputs, cursor ---- */
    bool pressed = poll_button(now_ms);
    step_idle(pressed);

    /* ---- 5. switches ---- */
    if (g_phase == CTRL_PHASE_SYNC)
        step_sync(r == LINK_OK);
    else
        step_switches(now_ms);

    /* ---- 6. forecast ---- */
    step_forecast(now_ms);

    /* ---- 7. render ---- */
    render(now_ms);

    if (g_fault_ticks > 0)
        g_fault_ticks--;
}

void controller_shutdown(void)
{
    link_shutdown();
    display_hw_blank();

    mini_printf("[CTRL] shutdown\n");
}

uint8_t controller_get_cursor(void)
{
    return g_cursor;
}

ctrl_phase_t controller_get_phase(void)
{
    return g_phase;
}

bool controller_get_snapshot(struct telemetry_snapshot *out)
{
    if (!g_have_snap)
        return false;

    *out = g_snap;
    return true;
}

bool controller_snapshot_stale(uint32_t now_ms)
{
    return !snapshot_fresh(now_ms);
}

void controller_get_text(struct screen_text *out)
{
    *out = g_text;
}

overlay_t controller_get_overlay(void)
{
    return g_overlay;
}

bool controller_get_status_alert(void)
{
    return g_alert;
}
