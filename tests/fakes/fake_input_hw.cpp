/*
 * fake_input_hw.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Scriptable switch and button levels
 */

#include "fakes/fake_input_hw.h"

static bool g_level[INPUT_COUNT];
static bool g_failing = false;

void fake_input_reset(void)
{
    for (int i = 0; i < INPUT_COUNT; i++)
        g_level[i] = false;
    g_failing = false;
}

void fake_input_set(input_line_t line, bool active)
{
    g_level[line] = active;
}

void fake_input_set_failing(bool failing)
{
    g_failing = failing;
}

bool input_hw_init(void)
{
    return true;
}

bool input_hw_read(input_line_t line, bool *active)
{
    if (g_failing || line >= INPUT_COUNT)
        return false;

    *active = g_level[line];
    return true;
}

void input_hw_close(void)
{
}
