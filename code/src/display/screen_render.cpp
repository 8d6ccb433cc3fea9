/*
 * screen_render.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Screen composition and rendering
 *
 * Notes:
 *  - German labels as on the installed panels
 *  - No floating point; tenths are printed as whole.frac
 */

#include "screen_render.h"
#include "console/mini_printf.h"

#include <string.h>

#define PANEL_W         128
#define PANEL_H         64

#define TEXT_X          4
#define TEXT_Y0         2
#define LINE_PITCH      16
#define TEXT_FONT       u8g2_font_6x12_tr

#define STATUS_X        113
#define STATUS_Y        2
#define STATUS_W        12
#define STATUS_H        14

/* --------------------------------------------------------------------------
 * Helpers
 * -------------------------------------------------------------------------- */

static void set_line(struct screen_text *t, int n, const char *fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    mini_vsnprintf(t->line[n], sizeof(t->line[n]), fmt, ap);
    va_end(ap);
}

static const char *on_off(bool on)
{
    return on ? "AN" : "AUS";
}

static const char *batt_label(batt_state_t s)
{
    switch (s) {
    case BATT_CHARGING:    return "Laden";
    case BATT_DISCHARGING: return "Entl.";
    default:               return "IDLE";
    }
}

/* Idle batteries show 0 W regardless of the measured trickle */
static int batt_power(const struct telemetry_snapshot *s)
{
    return (s->batt_state == BATT_IDLE) ? 0 : (int)s->batt_power_w;
}

static void forecast_line(struct screen_text *t, int n, const char *label,
                          const struct screen_model *m, forecast_day_t day)
{
    const struct forecast_cache *fc = m->forecast;

    if (!fc || !m->forecast_fresh || !fc->day_valid[day]) {
        set_line(t, n, "%s: -.- h", label);
        return;
    }

    uint16_t dh = fc->hours_dh[day];
    set_line(t, n, "%s: %u.%u h", label, (unsigned)(dh / 10), (unsigned)(dh % 10));
}

/* --------------------------------------------------------------------------
 * Screens
 * -------------------------------------------------------------------------- */

static void compose_overview(const struct screen_model *m, struct screen_text *t)
{
    const struct telemetry_snapshot *s = m->snap;

    if (!s) {
        set_line(t, 0, "PV:----W AC:----W");
        set_line(t, 1, "SOC: -- %%");
        set_line(t, 2, "Batt: ---- W");
        set_line(t, 3, "MP: --  G: --");
        return;
    }

    set_line(t, 0, "PV:%uW AC:%luW", (unsigned)s->pv_power_w, s->ac_load_w);
    set_line(t, 1, "SOC: %u %%", (unsigned)s->soc_pct);
    set_line(t, 2, "%s %d W", batt_label(s->batt_state), batt_power(s));
    set_line(t, 3, "MP: %s  G: %s",
             on_off(s->inverter == INVERTER_ON), on_off(s->generator_on));
}

static void compose_pv(const struct screen_model *m, struct screen_text *t)
{
    const struct telemetry_snapshot *s = m->snap;

    if (s) {
        set_line(t, 0, "PV: %u W", (unsigned)s->pv_power_w);
        set_line(t, 1, "Ertrag: %lu.%lu kWh", s->yield_dkwh / 10, s->yield_dkwh % 10);
        set_line(t, 2, "Batt: %u.%u V",
                 (unsigned)(s->batt_voltage_dv / 10), (unsigned)(s->batt_voltage_dv % 10));
    } else {
        set_line(t, 0, "PV: ---- W");
        set_line(t, 1, "Ertrag: --.- kWh");
        set_line(t, 2, "Batt: --.- V");
    }

    set_line(t, 3, "Zeit: %02d:%02d:%02d",
             m->clock.hour, m->clock.minute, m->clock.second);
}

static void compose_battery(const struct screen_model *m, struct screen_text *t)
{
    const struct telemetry_snapshot *s = m->snap;

    if (!s) {
        set_line(t, 0, "SoC: -- %%");
        set_line(t, 1, "Batt: ---- W");
        set_line(t, 2, "AC Last: ---- W");
        set_line(t, 3, "SoH: --.- %%");
        return;
    }

    set_line(t, 0, "SoC: %u %%", (unsigned)s->soc_pct);
    set_line(t, 1, "%s: %d W", batt_label(s->batt_state), batt_power(s));
    set_line(t, 2, "AC Last: %lu W", s->ac_load_w);
    set_line(t, 3, "SoH: %u.%u %%",
             (unsigned)(s->soh_dpct / 10), (unsigned)(s->soh_dpct % 10));
}

static void compose_sunshine(const struct screen_model *m, struct screen_text *t)
{
    const struct forecast_cache *fc = m->forecast;

    if (fc && fc->stamp_valid)
        set_line(t, 0, "%s Uhr", fc->stamp);
    else
        set_line(t, 0, "-- Uhr");

    if (m->clock.hour >= SCREEN_EVENING_HOUR)
        set_line(t, 1, "heute: vorbei");
    else
        forecast_line(t, 1, "heute", m, FORECAST_TODAY);

    forecast_line(t, 2, "morgen", m, FORECAST_TOMORROW);
    forecast_line(t, 3, "uebm", m, FORECAST_DAY_AFTER);
}

/* --------------------------------------------------------------------------
 * Overlays
 * -------------------------------------------------------------------------- */

static void compose_overlay(const struct screen_model *m, struct screen_text *t)
{
    const char *name = relay_name(m->relay);

    switch (m->overlay) {

    case OVERLAY_SYNC:
        set_line(t, 0, "INITIALISIERUNG");
        set_line(t, 1, "%s", name);
        set_line(t, 2, "bitte umschalten");
        set_line(t, 3, "auf %s", on_off(m->relay_on));
        break;

    case OVERLAY_PENDING:
        set_line(t, 0, "UMSCHALTEN:");
        set_line(t, 1, "%s: %s", name, on_off(m->relay_on));
        set_line(t, 2, "halten: %u s", (unsigned)m->seconds_left);
        set_line(t, 3, "zurueck = Abbruch");
        break;

    case OVERLAY_RELAY_FAULT:
        set_line(t, 0, "SCHALTFEHLER");
        set_line(t, 1, "%s", name);
        set_line(t, 2, "nicht geschaltet!");
        break;

    case OVERLAY_LAN:
        set_line(t, 0, "LAN-Kabel");
        set_line(t, 1, "einstecken oder");
        set_line(t, 2, "CERBO mit");
        set_line(t, 3, "LAN verbinden!");
        break;

    case OVERLAY_MESSAGE:
        for (int i = 0; i < SCREEN_LINES; i++)
            set_line(t, i, "%s", m->message[i] ? m->message[i] : "");
        break;

    case OVERLAY_NONE:
    default:
        break;
    }
}

/* --------------------------------------------------------------------------
 * Public API
 * -------------------------------------------------------------------------- */

void screen_compose(const struct screen_model *m, struct screen_text *out)
{
    memset(out, 0, sizeof(*out));

    if (m->overlay != OVERLAY_NONE) {
        compose_overlay(m, out);
    } else {
        switch (m->screen % SCREEN_COUNT) {
        case SCREEN_OVERVIEW: compose_overview(m, out); break;
        case SCREEN_PV:       compose_pv(m, out);       break;
        case SCREEN_BATTERY:  compose_battery(m, out);  break;
        case SCREEN_SUNSHINE: compose_sunshine(m, out); break;
        default: break;
        }
    }

    /* keep the status cell clear */
    out->line[0][SCREEN_COLS_TOP] = '\0';
}

void screen_draw(const struct screen_text *text, bool status_alert, u8g2_t *u8g2)
{
    u8g2_ClearBuffer(u8g2);

    u8g2_SetDrawColor(u8g2, 1);
    u8g2_DrawFrame(u8g2, 0, 0, PANEL_W, PANEL_H);

    u8g2_SetFont(u8g2, TEXT_FONT);
    u8g2_SetFontMode(u8g2, 1);
    u8g2_SetFontPosTop(u8g2);

    for (int i = 0; i < SCREEN_LINES; i++)
        u8g2_DrawStr(u8g2, TEXT_X, TEXT_Y0 + i * LINE_PITCH, text->line[i]);

    if (status_alert) {
        u8g2_DrawBox(u8g2, STATUS_X, STATUS_Y, STATUS_W, STATUS_H);
        u8g2_SetDrawColor(u8g2, 0);
        u8g2_DrawStr(u8g2, STATUS_X + 3, STATUS_Y + 1, "!");
        u8g2_SetDrawColor(u8g2, 1);
    }
}

void screen_render(const struct screen_model *m, u8g2_t *u8g2)
{
    struct screen_text text;

    screen_compose(m, &text);
    screen_draw(&text, m->status_alert, u8g2);
}
