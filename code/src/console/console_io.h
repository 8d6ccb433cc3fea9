/*
 * console_io.h
 *
 * Project: Solar Display Controller
 * Purpose: Console output used by the log formatter
 *
 * Notes:
 *  - Implemented per platform
 *  - Linux: stdout (captured by the service journal)
 *
 * Updated: 2026-10-12
 */

#pragma once

void console_putc(char c);
void console_puts(const char *s);

/* Flush buffered console output (end of line, shutdown) */
void console_flush(void);
