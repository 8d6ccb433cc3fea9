/*
 * net_hw.h
 *
 * Project: Solar Display Controller
 * Purpose: Local network lookup for discovery
 *
 * Notes:
 *  - Implemented per platform (Linux: getifaddrs)
 *
 * Updated: 2026-10-14
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

/*
 * First three octets of the primary IPv4 address.
 *
 * - Loopback and link-local interfaces are skipped
 * - host receives the last octet of the own address
 */
bool net_hw_local_subnet(uint8_t subnet[3], uint8_t *host);
