/*
 * mini_printf.h
 *
 * Project: Solar Display Controller
 * Purpose: Tagged log output
 *
 * Notes:
 *  - Single control thread
 *  - Deterministic behavior
 *  - Output goes through console_putc()
 *
 * Updated: 2026-10-12
 */


 /*
  * mini_printf()
  *
  * Lightweight, deterministic printf replacement used for all
  * log output. Every log line starts with a bracketed subsystem
  * tag, e.g. "[LINK] connected 192.168.1.65:502\n".
  *
  * Design goals:
  *  - No heap use
  *  - No floating point (values are fixed-point integers)
  *  - No locale
  *  - Fully deterministic
  *
  * Supported format specifiers:
  *
  *   %s      const char *   (NULL prints "(null)")
  *   %c      char
  *   %u      unsigned int
  *   %d      int
  *   %lu     uint32_t
  *   %ld     int32_t
  *   %x      uint8_t as two hex digits
  *   %L      int32_t interpreted as latitude/longitude e4
  *           (prints signed DD.DDDD)
  *   %%      literal %
  *
  * Optional features:
  *
  *   Width:  %5u   %02d
  *           - Numeric width supported
  *           - Zero padding supported with leading '0'
  *           - Padding applies only to %u and %d
  *
  * NOT supported:
  *
  *   - %f or any floating point
  *   - precision (.2)
  *   - left alignment (-)
  *
  * If an unsupported specifier is encountered,
  * a '?' character is printed.
  */

#pragma once

#include <stdarg.h>
#include <stddef.h>

void mini_printf(const char *fmt, ...);

/*
 * Format into a caller buffer instead of the console.
 *
 * Same specifiers as mini_printf(). Output is always
 * NUL-terminated and truncated to cap - 1 characters.
 *
 * Returns number of characters stored (excluding NUL).
 */
size_t mini_snprintf(char *buf, size_t cap, const char *fmt, ...);
size_t mini_vsnprintf(char *buf, size_t cap, const char *fmt, va_list ap);
