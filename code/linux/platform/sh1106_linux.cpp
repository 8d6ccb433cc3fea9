/*
 * sh1106_linux.cpp
 *
 * Project: Solar Display Controller
 * Purpose: SH1106 128x64 OLED through U8g2 over Linux i2c-dev
 *
 * Notes:
 *  - U8g2 full-frame driver (sh1106_i2c_128x64_noname_f); it knows the
 *    column offset and init sequence of the panel
 *  - The byte callback collects one U8x8 transfer and writes it as a
 *    single i2c message
 *  - Write errors are latched per flush
 *
 * Updated: 2026-10-19
 */

#include "display_hw.h"
#include "config.h"
#include "uptime.h"
#include "console/mini_printf.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/i2c-dev.h>

#define XFER_MAX    160

static u8g2_t   g_u8g2;
static bool     g_setup     = false;
static int      g_fd        = -1;
static bool     g_io_failed = false;

static uint8_t  g_xfer[XFER_MAX];
static size_t   g_xfer_len  = 0;

/* --------------------------------------------------------------------------
 * U8x8 callbacks
 * -------------------------------------------------------------------------- */

static uint8_t i2c_byte_cb(u8x8_t *u8x8, uint8_t msg, uint8_t arg_int, void *arg_ptr)
{
    (void)u8x8;

    switch (msg) {
    case U8X8_MSG_BYTE_INIT:
    case U8X8_MSG_BYTE_SET_DC:
        break;

    case U8X8_MSG_BYTE_START_TRANSFER:
        g_xfer_len = 0;
        break;

    case U8X8_MSG_BYTE_SEND:
        if (g_xfer_len + arg_int > sizeof(g_xfer)) {
            g_io_failed = true;
            return 0;
        }
        memcpy(&g_xfer[g_xfer_len], arg_ptr, arg_int);
        g_xfer_len += arg_int;
        break;

    case U8X8_MSG_BYTE_END_TRANSFER:
        if (g_fd < 0 || write(g_fd, g_xfer, g_xfer_len) != (ssize_t)g_xfer_len) {
            g_io_failed = true;
            return 0;
        }
        break;

    default:
        return 0;
    }

    return 1;
}

static uint8_t delay_cb(u8x8_t *u8x8, uint8_t msg, uint8_t arg_int, void *arg_ptr)
{
    (void)u8x8;
    (void)arg_ptr;

    switch (msg) {
    case U8X8_MSG_DELAY_MILLI:
        uptime_sleep_ms(arg_int);
        break;

    default:
        /* no GPIO lines, sub-millisecond delays are covered by the bus */
        break;
    }

    return 1;
}

/* --------------------------------------------------------------------------
 * Public API
 * -------------------------------------------------------------------------- */

bool display_hw_init(uint8_t rotation)
{
    char dev[24];

    display_hw_close();

    u8g2_Setup_sh1106_i2c_128x64_noname_f(&g_u8g2, (rotation == 2) ? U8G2_R2 : U8G2_R0,
                                          i2c_byte_cb, delay_cb);
    u8g2_SetI2CAddress(&g_u8g2, (uint8_t)(g_cfg.i2c_address << 1));
    g_setup = true;

    mini_snprintf(dev, sizeof(dev), "/dev/i2c-%u", (unsigned)g_cfg.i2c_bus);

    g_fd = open(dev, O_RDWR | O_CLOEXEC);
    if (g_fd < 0) {
        mini_printf("[DISPLAY] open %s failed (errno %d)\n", dev, errno);
        return false;
    }

    if (ioctl(g_fd, I2C_SLAVE, (long)g_cfg.i2c_address) < 0) {
        mini_printf("[DISPLAY] address 0x%x rejected (errno %d)\n",
                    (unsigned)g_cfg.i2c_address, errno);
        display_hw_close();
        return false;
    }

    g_io_failed = false;
    u8g2_InitDisplay(&g_u8g2);
    u8g2_ClearBuffer(&g_u8g2);
    u8g2_SendBuffer(&g_u8g2);
    u8g2_SetPowerSave(&g_u8g2, 0);

    if (g_io_failed) {
        mini_printf("[DISPLAY] no answer at 0x%x on %s\n", (unsigned)g_cfg.i2c_address, dev);
        display_hw_close();
        return false;
    }

    mini_printf("[DISPLAY] SH1106 at 0x%x on %s\n", (unsigned)g_cfg.i2c_address, dev);
    return true;
}

u8g2_t *display_hw_u8g2(void)
{
    return g_setup ? &g_u8g2 : NULL;
}

bool display_hw_flush(void)
{
    if (!g_setup || g_fd < 0)
        return false;

    g_io_failed = false;
    u8g2_SendBuffer(&g_u8g2);
    return !g_io_failed;
}

void display_hw_blank(void)
{
    if (!g_setup || g_fd < 0)
        return;

    u8g2_ClearBuffer(&g_u8g2);
    u8g2_SendBuffer(&g_u8g2);
    u8g2_SetPowerSave(&g_u8g2, 1);

    if (g_io_failed)
        mini_printf("[DISPLAY] blank failed\n");
}

void display_hw_close(void)
{
    if (g_fd < 0)
        return;

    (void)close(g_fd);
    g_fd = -1;
}
