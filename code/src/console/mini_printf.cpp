/*
 * mini_printf.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Minimal formatter for log lines and screen text
 *
 * Notes:
 *  - Single control thread
 *  - Deterministic behavior
 *  - No heap, no floating point
 *
 * Updated: 2026-10-12
 */

#include <stdarg.h>
#include <stdbool.h>
#include <stdint.h>

#include "mini_printf.h"
#include "console_io.h"

/*
 * Output sink.
 *  - buf == NULL → console
 *  - buf != NULL → bounded buffer
 */
struct sink {
    char   *buf;
    size_t  cap;
    size_t  len;
};

static void sink_putc(struct sink *s, char c)
{
    if (!s->buf) {
        console_putc(c);
        s->len++;
        return;
    }

    if (s->len + 1 < s->cap)
        s->buf[s->len++] = c;
}

static void sink_puts(struct sink *s, const char *str)
{
    if (!str)
        str = "(null)";

    while (*str)
        sink_putc(s, *str++);
}

/* print unsigned long (32-bit) with optional zero padding */
static void put_ulong_pad(struct sink *s, uint32_t v, unsigned int width, char pad)
{
    char buf[12];
    unsigned int i = 0;

    if (v == 0) {
        buf[i++] = '0';
    } else {
        while (v > 0) {
            buf[i++] = (char)('0' + (v % 10));
            v /= 10;
        }
    }

    while (i < width && i < sizeof(buf))
        buf[i++] = pad;

    while (i--)
        sink_putc(s, buf[i]);
}

static void put_long_pad(struct sink *s, int32_t v, unsigned int width, char pad)
{
    if (v < 0) {
        sink_putc(s, '-');
        put_ulong_pad(s, (uint32_t)(-(int64_t)v), width ? width - 1 : 0, pad);
    } else {
        put_ulong_pad(s, (uint32_t)v, width, pad);
    }
}

static void put_latlon_e4(struct sink *s, int32_t v)
{
    if (v < 0) {
        sink_putc(s, '-');
        v = -v;
    }

    int32_t deg = v / 10000;
    int32_t frac = v % 10000;

    put_long_pad(s, deg, 0, ' ');
    sink_putc(s, '.');
    put_ulong_pad(s, (uint32_t)frac, 4, '0');
}

static void put_hex8(struct sink *s, uint8_t v)
{
    const char *hex = "0123456789ABCDEF";
    sink_putc(s, hex[(v >> 4) & 0x0F]);
    sink_putc(s, hex[v & 0x0F]);
}

static void format(struct sink *s, const char *fmt, va_list ap)
{
    while (*fmt) {

        if (*fmt != '%') {
            sink_putc(s, *fmt++);
            continue;
        }

        fmt++; /* skip '%' */

        if (!*fmt)
            break;

        /* parse zero pad */
        char pad = ' ';
        if (*fmt == '0') {
            pad = '0';
            fmt++;
        }

        /* parse width */
        unsigned int width = 0;
        while (*fmt >= '0' && *fmt <= '9') {
            width = width * 10 + (unsigned int)(*fmt - '0');
            fmt++;
        }

        /* parse optional long modifier */
        bool long_flag = false;
        if (*fmt == 'l') {
            long_flag = true;
            fmt++;
        }

        switch (*fmt) {

        case 's':
            sink_puts(s, va_arg(ap, const char *));
            break;

        case 'c':
            sink_putc(s, (char)va_arg(ap, int));
            break;

        case 'u':
            if (long_flag)
                put_ulong_pad(s, va_arg(ap, uint32_t), width, pad);
            else
                put_ulong_pad(s, va_arg(ap, unsigned int), width, pad);
            break;

        case 'd':
            if (long_flag)
                put_long_pad(s, va_arg(ap, int32_t), width, pad);
            else
                put_long_pad(s, va_arg(ap, int), width, pad);
            break;

        case 'L':
            put_latlon_e4(s, va_arg(ap, int32_t));
            break;

        case 'x':
        case 'X':
            put_hex8(s, (uint8_t)va_arg(ap, unsigned int));
            break;

        case '%':
            sink_putc(s, '%');
            break;

        case '\0':
            return;

        default:
            sink_putc(s, '?');
            break;
        }

        fmt++;
    }
}

void mini_printf(const char *fmt, ...)
{
    struct sink s = { NULL, 0, 0 };

    va_list ap;
    va_start(ap, fmt);
    format(&s, fmt, ap);
    va_end(ap);
}

size_t mini_vsnprintf(char *buf, size_t cap, const char *fmt, va_list ap)
{
    if (!buf || cap == 0)
        return 0;

    struct sink s = { buf, cap, 0 };
    format(&s, fmt, ap);

    buf[s.len] = '\0';
    return s.len;
}

size_t mini_snprintf(char *buf, size_t cap, const char *fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    size_t n = mini_vsnprintf(buf, cap, fmt, ap);
    va_end(ap);

    return n;
}
