/*
 * test_button_debounce.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Press recognition with refractory period
 */

#include <gtest/gtest.h>

#include "devices/button_debounce.h"

#define REFRACTORY_MS 250u

TEST(ButtonDebounce, PressCountsOnRelease)
{
    struct button_debounce b;
    button_init(&b, false);

    EXPECT_FALSE(button_sample(&b, true, 1000, REFRACTORY_MS));
    EXPECT_FALSE(button_sample(&b, true, 1100, REFRACTORY_MS));
    EXPECT_TRUE(button_sample(&b, false, 1300, REFRACTORY_MS));
    EXPECT_FALSE(button_sample(&b, false, 1400, REFRACTORY_MS));
}

TEST(ButtonDebounce, BounceInsideRefractoryIgnored)
{
    struct button_debounce b;
    button_init(&b, false);

    int presses = 0;
    uint32_t t = 1000;

    /* contact bounce on press: 1/0/1/0/1 every 20 ms */
    const bool bounce[] = { true, false, true, false, true, true, true };
    for (bool level : bounce) {
        presses += button_sample(&b, level, t, REFRACTORY_MS);
        t += 20;
    }

    /* held, then released with bounce */
    t = 1500;
    const bool release[] = { false, true, false, false };
    for (bool level : release) {
        presses += button_sample(&b, level, t, REFRACTORY_MS);
        t += 20;
    }

    EXPECT_EQ(1, presses);
}

TEST(ButtonDebounce, ShortTapStillCounts)
{
    struct button_debounce b;
    button_init(&b, false);

    EXPECT_FALSE(button_sample(&b, true, 1000, REFRACTORY_MS));
    EXPECT_FALSE(button_sample(&b, false, 1100, REFRACTORY_MS));

    /* release is accepted once the refractory period is over */
    EXPECT_TRUE(button_sample(&b, false, 1260, REFRACTORY_MS));
}

TEST(ButtonDebounce, HeldAtStartupIsNotAPress)
{
    struct button_debounce b;
    button_init(&b, true);

    EXPECT_FALSE(button_sample(&b, false, 1000, REFRACTORY_MS));
    EXPECT_FALSE(button_sample(&b, true, 2000, REFRACTORY_MS));
    EXPECT_TRUE(button_sample(&b, false, 3000, REFRACTORY_MS));
}

TEST(ButtonDebounce, RepeatedPresses)
{
    struct button_debounce b;
    button_init(&b, false);

    int presses = 0;
    for (uint32_t t = 0; t < 6000; t += 600) {
        presses += button_sample(&b, true, t, REFRACTORY_MS);
        presses += button_sample(&b, false, t + 300, REFRACTORY_MS);
    }

    EXPECT_EQ(10, presses);
}
