/*
 * rtc_linux.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Linux wall clock
 *
 * Notes:
 *  - System time is kept by NTP; no RTC chip access
 *
 * Updated: 2026-10-15
 */

#include "rtc.h"

#include <time.h>
#include <string.h>

void rtc_get_time(int *year,
                  int *month,
                  int *day,
                  int *hour,
                  int *minute,
                  int *second)
{
    /* Caller bug protection */
    if (!year || !month || !day || !hour || !minute || !second)
        return;

    time_t now = time(NULL);
    struct tm lt;
    memset(&lt, 0, sizeof(lt));

    localtime_r(&now, &lt);

    *year   = lt.tm_year + 1900;
    *month  = lt.tm_mon + 1;
    *day    = lt.tm_mday;
    *hour   = lt.tm_hour;
    *minute = lt.tm_min;
    *second = lt.tm_sec;
}

uint32_t rtc_epoch(void)
{
    return (uint32_t)time(NULL);
}
