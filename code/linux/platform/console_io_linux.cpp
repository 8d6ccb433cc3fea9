/*
 * console_io_linux.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Linux console output
 *
 * Notes:
 *  - stdout, line buffered; the service journal captures it
 *
 * Updated: 2026-10-15
 */

#include "console/console_io.h"

#include <stdio.h>

void console_putc(char c)
{
    fputc(c, stdout);

    if (c == '\n')
        fflush(stdout);
}

void console_puts(const char *s)
{
    while (*s)
        console_putc(*s++);
}

void console_flush(void)
{
    fflush(stdout);
}
