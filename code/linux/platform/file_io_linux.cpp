/*
 * file_io_linux.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Linux text file access
 *
 * Updated: 2026-10-15
 */

#include "file_io.h"
#include "console/mini_printf.h"

#include <stdio.h>
#include <string.h>
#include <sys/stat.h>

#define TMP_SUFFIX ".tmp"

bool file_read_text(const char *path, char *buf, size_t cap, uint32_t *out_mtime)
{
    if (!path || !buf || cap == 0)
        return false;

    FILE *f = fopen(path, "rb");
    if (!f)
        return false;

    size_t n = fread(buf, 1, cap - 1, f);
    bool   too_big = (n == cap - 1) && (fgetc(f) != EOF);
    bool   failed  = ferror(f) != 0;

    struct stat st;
    bool have_stat = (fstat(fileno(f), &st) == 0);

    fclose(f);

    if (too_big || failed) {
        buf[0] = '\0';
        return false;
    }

    buf[n] = '\0';

    if (out_mtime)
        *out_mtime = have_stat ? (uint32_t)st.st_mtime : 0;

    return true;
}

bool file_write_text(const char *path, const char *text)
{
    char tmp[256];

    if (strlen(path) + sizeof(TMP_SUFFIX) > sizeof(tmp))
        return false;

    mini_snprintf(tmp, sizeof(tmp), "%s%s", path, TMP_SUFFIX);

    FILE *f = fopen(tmp, "wb");
    if (!f)
        return false;

    size_t len = strlen(text);
    bool ok = (fwrite(text, 1, len, f) == len);

    if (fclose(f) != 0)
        ok = false;

    if (!ok || rename(tmp, path) != 0) {
        (void)remove(tmp);
        return false;
    }

    return true;
}
