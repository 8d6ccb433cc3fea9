/*
 * main_linux.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Linux entry point
 *
 * Notes:
 *  - Usage: solar_display [config.json]
 *  - Runs discovery once when no host is configured
 *  - SIGINT / SIGTERM end the loop; cleanup runs on every exit path
 *  - A non-zero exit lets the service manager restart us
 *
 * Updated: 2026-10-19
 */

#include "config.h"
#include "controller.h"
#include "discovery.h"
#include "display_hw.h"
#include "input_hw.h"
#include "net_hw.h"
#include "uptime.h"
#include "display/screen_render.h"
#include "console/console_io.h"
#include "console/mini_printf.h"

#include <signal.h>
#include <string.h>

#define DEFAULT_CONFIG_PATH   "config.json"
#define LOOP_PERIOD_MS        20
#define NOT_FOUND_HOLD_MS     5000

static volatile sig_atomic_t g_exit = 0;

static void on_signal(int sig)
{
    (void)sig;
    g_exit = 1;
}

static void install_signals(void)
{
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);

    sigaction(SIGINT,  &sa, NULL);
    sigaction(SIGTERM, &sa, NULL);
}

static bool exit_requested(void)
{
    return g_exit != 0;
}

static void show_message(const char *l0, const char *l1)
{
    struct screen_model m;
    u8g2_t *u8g2 = display_hw_u8g2();

    if (!u8g2)
        return;

    memset(&m, 0, sizeof(m));
    m.overlay    = OVERLAY_MESSAGE;
    m.message[1] = l0;
    m.message[2] = l1;

    screen_render(&m, u8g2);
    if (!display_hw_flush())
        mini_printf("[MAIN] message not shown: %s\n", l0);
}

/* Resolve and persist the device address. False: nothing found. */
static bool run_discovery(const char *cfg_path)
{
    uint8_t subnet[3];
    uint8_t self = 0;
    char    line[24];

    if (!net_hw_local_subnet(subnet, &self)) {
        mini_printf("[MAIN] no IPv4 interface\n");
        show_message("Kein Cerbo gefunden!", "kein Netzwerk");
        return false;
    }

    mini_snprintf(line, sizeof(line), "%u.%u.%u.x",
                  (unsigned)subnet[0], (unsigned)subnet[1], (unsigned)subnet[2]);
    show_message("Suche Cerbo...", line);

    if (!discovery_run(subnet, g_cfg.device_port, g_cfg.device_host,
                       sizeof(g_cfg.device_host), exit_requested)) {
        if (exit_requested())
            return false;
        show_message("Kein Cerbo gefunden!", line);
        return false;
    }

    if (!config_save(cfg_path, &g_cfg))
        mini_printf("[MAIN] host %s not persisted\n", g_cfg.device_host);

    return true;
}

static void cleanup(void)
{
    display_hw_close();
    input_hw_close();
    console_flush();
}

int main(int argc, char **argv)
{
    const char *cfg_path = (argc > 1) ? argv[1] : DEFAULT_CONFIG_PATH;

    uptime_init();
    install_signals();

    (void)config_load(cfg_path, &g_cfg);

    mini_printf("[MAIN] solar display starting, config %s\n", cfg_path);

    /* panel is optional: without it the loop still logs and switches */
    if (!display_hw_init(g_cfg.display_rotation))
        mini_printf("[MAIN] display unavailable\n");

    if (!input_hw_init()) {
        mini_printf("[MAIN] inputs unavailable\n");
        cleanup();
        return 1;
    }

    if (!g_cfg.device_host[0] && !run_discovery(cfg_path)) {
        if (exit_requested()) {
            cleanup();
            return 0;
        }
        uptime_sleep_ms(NOT_FOUND_HOLD_MS);
        cleanup();
        return 1;
    }

    controller_init(uptime_millis());

    uint32_t last_tick = uptime_millis() - g_cfg.poll_period_ms;

    while (!g_exit) {
        uint32_t now_ms = uptime_millis();

        controller_poll(now_ms);

        if ((uint32_t)(now_ms - last_tick) >= g_cfg.poll_period_ms) {
            last_tick = now_ms;
            controller_tick(now_ms);
        }

        uptime_sleep_ms(LOOP_PERIOD_MS);
    }

    mini_printf("[MAIN] signal, exiting after %lu s\n", uptime_seconds());

    controller_shutdown();
    cleanup();
    return 0;
}
