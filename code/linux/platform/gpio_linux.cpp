/*
 * gpio_linux.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Switch and button inputs via the GPIO character device
 *
 * Notes:
 *  - GPIO v2 uAPI, one request for all three lines
 *  - Input, pull-up, active low: the kernel reports logical levels
 *  - Line order in the request matches input_line_t
 *
 * Updated: 2026-10-16
 */

#include "input_hw.h"
#include "config.h"
#include "console/mini_printf.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/gpio.h>

#define GPIO_CONSUMER "solar-display"

static int g_req_fd = -1;

bool input_hw_init(void)
{
    input_hw_close();

    int chip = open(g_cfg.gpio_chip, O_RDONLY | O_CLOEXEC);
    if (chip < 0) {
        mini_printf("[INPUT] open %s failed (errno %d)\n", g_cfg.gpio_chip, errno);
        return false;
    }

    struct gpio_v2_line_request req;
    memset(&req, 0, sizeof(req));

    req.offsets[INPUT_GENERATOR] = g_cfg.gpio_generator;
    req.offsets[INPUT_MULTIPLUS] = g_cfg.gpio_multiplus;
    req.offsets[INPUT_BUTTON]    = g_cfg.gpio_button;
    req.num_lines                = INPUT_COUNT;

    strncpy(req.consumer, GPIO_CONSUMER, sizeof(req.consumer) - 1);

    req.config.flags = GPIO_V2_LINE_FLAG_INPUT |
                       GPIO_V2_LINE_FLAG_BIAS_PULL_UP |
                       GPIO_V2_LINE_FLAG_ACTIVE_LOW;

    int rc = ioctl(chip, GPIO_V2_GET_LINE_IOCTL, &req);
    int err = errno;

    close(chip);

    if (rc < 0) {
        mini_printf("[INPUT] line request %u/%u/%u failed (errno %d)\n",
                    (unsigned)g_cfg.gpio_generator, (unsigned)g_cfg.gpio_multiplus,
                    (unsigned)g_cfg.gpio_button, err);
        return false;
    }

    g_req_fd = req.fd;

    mini_printf("[INPUT] lines %u/%u/%u on %s\n",
                (unsigned)g_cfg.gpio_generator, (unsigned)g_cfg.gpio_multiplus,
                (unsigned)g_cfg.gpio_button, g_cfg.gpio_chip);
    return true;
}

bool input_hw_read(input_line_t line, bool *active)
{
    if (g_req_fd < 0 || line >= INPUT_COUNT)
        return false;

    struct gpio_v2_line_values v;
    memset(&v, 0, sizeof(v));
    v.mask = 1ULL << line;

    if (ioctl(g_req_fd, GPIO_V2_LINE_GET_VALUES_IOCTL, &v) < 0)
        return false;

    *active = (v.bits & (1ULL << line)) != 0;
    return true;
}

void input_hw_close(void)
{
    if (g_req_fd < 0)
        return;

    (void)close(g_req_fd);
    g_req_fd = -1;
}
