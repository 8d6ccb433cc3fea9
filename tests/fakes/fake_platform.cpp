/*
 * fake_platform.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Test doubles for uptime, wall clock, console and files
 */

#include "fakes/fake_platform.h"

#include "uptime.h"
#include "rtc.h"
#include "file_io.h"
#include "console/console_io.h"

#include <map>
#include <string.h>

struct fake_file {
    std::string text;
    uint32_t    mtime;
};

static uint32_t g_uptime_ms = 0;

static int      g_hour   = 12;
static int      g_minute = 0;
static int      g_second = 0;
static uint32_t g_epoch  = 1760000000u;

static std::string                       g_console;
static std::map<std::string, fake_file>  g_files;

void fake_platform_reset(void)
{
    g_uptime_ms = 0;
    g_hour      = 12;
    g_minute    = 0;
    g_second    = 0;
    g_epoch     = 1760000000u;
    g_console.clear();
    g_files.clear();
}

/* ---- uptime ---- */

void fake_uptime_set(uint32_t ms)     { g_uptime_ms = ms; }
void fake_uptime_advance(uint32_t ms) { g_uptime_ms += ms; }

void uptime_init(void) {}

uint32_t uptime_millis(void)  { return g_uptime_ms; }
uint32_t uptime_seconds(void) { return g_uptime_ms / 1000; }

void uptime_sleep_ms(uint32_t ms)
{
    g_uptime_ms += ms;
}

/* ---- wall clock ---- */

void fake_rtc_set(int hour, int minute, int second, uint32_t epoch)
{
    g_hour   = hour;
    g_minute = minute;
    g_second = second;
    g_epoch  = epoch;
}

void rtc_get_time(int *year, int *month, int *day,
                  int *hour, int *minute, int *second)
{
    *year   = 2026;
    *month  = 10;
    *day    = 19;
    *hour   = g_hour;
    *minute = g_minute;
    *second = g_second;
}

uint32_t rtc_epoch(void)
{
    return g_epoch;
}

/* ---- console ---- */

const std::string &fake_console_text(void) { return g_console; }
void fake_console_clear(void)              { g_console.clear(); }

void console_putc(char c)
{
    g_console.push_back(c);
}

void console_puts(const char *s)
{
    g_console.append(s);
}

void console_flush(void) {}

/* ---- files ---- */

void fake_file_set(const std::string &path, const std::string &text, uint32_t mtime)
{
    g_files[path] = fake_file{ text, mtime };
}

bool fake_file_exists(const std::string &path)
{
    return g_files.count(path) != 0;
}

std::string fake_file_text(const std::string &path)
{
    auto it = g_files.find(path);
    return (it == g_files.end()) ? std::string() : it->second.text;
}

bool file_read_text(const char *path, char *buf, size_t cap, uint32_t *out_mtime)
{
    auto it = g_files.find(path);
    if (it == g_files.end())
        return false;

    if (it->second.text.size() + 1 > cap)
        return false;

    memcpy(buf, it->second.text.c_str(), it->second.text.size() + 1);

    if (out_mtime)
        *out_mtime = it->second.mtime;

    return true;
}

bool file_write_text(const char *path, const char *text)
{
    g_files[path] = fake_file{ text, g_epoch };
    return true;
}
