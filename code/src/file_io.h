/*
 * file_io.h
 *
 * Project: Solar Display Controller
 * Purpose: Small text file access (config, forecast cache)
 *
 * Notes:
 *  - Implemented per platform
 *  - Whole-file reads into caller buffers, no heap
 *
 * Updated: 2026-10-13
 */

#pragma once

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

/*
 * Read a text file.
 *
 * Parameters:
 *  - path      : file path
 *  - buf, cap  : destination, always NUL-terminated on success
 *  - out_mtime : optional, receives modification time (epoch seconds)
 *
 * Returns:
 *  - true  if the file was read completely
 *  - false if missing, unreadable or larger than cap - 1
 */
bool file_read_text(const char *path, char *buf, size_t cap,
                    uint32_t *out_mtime);

/*
 * Replace a text file.
 *
 * Writes to "<path>.tmp" and renames over the target.
 */
bool file_write_text(const char *path, const char *text);
