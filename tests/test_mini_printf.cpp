/*
 * test_mini_printf.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Formatter behavior
 */

#include <gtest/gtest.h>

#include "console/mini_printf.h"
#include "fakes/fake_platform.h"

TEST(MiniPrintf, FormatsIntegersWithPadding)
{
    char buf[32];

    mini_snprintf(buf, sizeof(buf), "%02d:%02d:%02d", 7, 5, 0);
    EXPECT_STREQ("07:05:00", buf);

    mini_snprintf(buf, sizeof(buf), "[%5u]", 42u);
    EXPECT_STREQ("[   42]", buf);

    mini_snprintf(buf, sizeof(buf), "%d W", -350);
    EXPECT_STREQ("-350 W", buf);
}

TEST(MiniPrintf, FormatsLongAndLatLon)
{
    char buf[32];

    mini_snprintf(buf, sizeof(buf), "%lu", (uint32_t)4000000000u);
    EXPECT_STREQ("4000000000", buf);

    mini_snprintf(buf, sizeof(buf), "%L", (int32_t)508450);
    EXPECT_STREQ("50.8450", buf);

    mini_snprintf(buf, sizeof(buf), "%L", (int32_t)-74830);
    EXPECT_STREQ("-7.4830", buf);
}

TEST(MiniPrintf, HexIsTwoDigits)
{
    char buf[16];

    mini_snprintf(buf, sizeof(buf), "0x%x", 0x3Cu);
    EXPECT_STREQ("0x3C", buf);
}

TEST(MiniPrintf, TruncatesToBuffer)
{
    char buf[6];

    size_t n = mini_snprintf(buf, sizeof(buf), "%s", "INITIALISIERUNG");
    EXPECT_EQ(5u, n);
    EXPECT_STREQ("INITI", buf);
}

TEST(MiniPrintf, ConsoleOutputGoesThroughPutc)
{
    fake_console_clear();

    mini_printf("[LINK] %s %u%%\n", "up", 100u);
    EXPECT_EQ("[LINK] up 100%\n", fake_console_text());
}
