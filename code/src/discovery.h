/*
 * discovery.h
 *
 * Project: Solar Display Controller
 * Purpose: One-shot Cerbo GX discovery on the local /24
 *
 * Notes:
 *  - Runs before the control loop, only when no host is configured
 *  - Priority hosts first, then the rest of 1..254
 *  - A responder is a device answering input register 800 on unit 100
 *  - Blocking: worst case 254 probes of DISCOVERY_PROBE_MS each
 *
 * Updated: 2026-10-19
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#define DISCOVERY_PROBE_MS      300
#define DISCOVERY_HOSTS         254

/*
 * Probe order of last octets.
 *
 * Returns:
 *  - number of entries written (DISCOVERY_HOSTS when cap allows)
 */
size_t discovery_order(uint8_t *out, size_t cap);

/* Single probe: connect, read register 800 on unit 100, close */
bool discovery_probe(const char *host, uint16_t port, uint32_t timeout_ms);

/*
 * Scan subnet.0/24.
 *
 * should_abort (may be NULL) is checked before every probe.
 *
 * Returns:
 *  - true and the dotted address in out_host on the first responder
 *  - false when nothing answered or the scan was aborted
 */
bool discovery_run(const uint8_t subnet[3], uint16_t port,
                   char *out_host, size_t cap, bool (*should_abort)(void));
