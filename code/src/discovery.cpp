/*
 * discovery.cpp
 *
 * Project: Solar Display Controller
 * Purpose: One-shot Cerbo GX discovery on the local /24
 */

#include "discovery.h"

#include "modbus_hw.h"
#include "register_map.h"
#include "console/mini_printf.h"

#include <string.h>

/* Addresses routers and Cerbo installs usually end up on */
static const uint8_t k_priority[] = { 1, 65, 100, 200, 2, 10, 50, 150, 254 };

static bool is_priority(uint8_t host)
{
    for (size_t i = 0; i < sizeof(k_priority); i++) {
        if (k_priority[i] == host)
            return true;
    }
    return false;
}

size_t discovery_order(uint8_t *out, size_t cap)
{
    size_t n = 0;

    for (size_t i = 0; i < sizeof(k_priority) && n < cap; i++)
        out[n++] = k_priority[i];

    for (unsigned h = 1; h <= DISCOVERY_HOSTS && n < cap; h++) {
        if (!is_priority((uint8_t)h))
            out[n++] = (uint8_t)h;
    }

    return n;
}

bool discovery_probe(const char *host, uint16_t port, uint32_t timeout_ms)
{
    uint16_t value = 0;

    if (!modbus_hw_connect(host, port, timeout_ms))
        return false;

    modbus_status_t st = modbus_hw_read_input(REG_UNIT_SYSTEM, REG_PROBE, 1, &value,
                                              timeout_ms, NULL);
    modbus_hw_close();

    return st == MODBUS_OK;
}

bool discovery_run(const uint8_t subnet[3], uint16_t port,
                   char *out_host, size_t cap, bool (*should_abort)(void))
{
    uint8_t order[DISCOVERY_HOSTS];
    size_t  count = discovery_order(order, sizeof(order));
    char    host[16];

    mini_printf("[DISCOVERY] scanning %u.%u.%u.0/24\n",
                (unsigned)subnet[0], (unsigned)subnet[1], (unsigned)subnet[2]);

    for (size_t i = 0; i < count; i++) {
        if (should_abort && should_abort()) {
            mini_printf("[DISCOVERY] aborted after %u probes\n", (unsigned)i);
            return false;
        }

        mini_snprintf(host, sizeof(host), "%u.%u.%u.%u",
                      (unsigned)subnet[0], (unsigned)subnet[1],
                      (unsigned)subnet[2], (unsigned)order[i]);

        if (!discovery_probe(host, port, DISCOVERY_PROBE_MS))
            continue;

        if (strlen(host) + 1 > cap)
            return false;

        strcpy(out_host, host);
        mini_printf("[DISCOVERY] found %s (%s scan)\n", host,
                    is_priority(order[i]) ? "priority" : "full");
        return true;
    }

    mini_printf("[DISCOVERY] no responder on %u.%u.%u.0/24\n",
                (unsigned)subnet[0], (unsigned)subnet[1], (unsigned)subnet[2]);
    return false;
}
