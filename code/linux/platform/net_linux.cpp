/*
 * net_linux.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Local IPv4 subnet lookup
 *
 * Updated: 2026-10-16
 */

#include "net_hw.h"
#include "console/mini_printf.h"

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/socket.h>

bool net_hw_local_subnet(uint8_t subnet[3], uint8_t *host)
{
    struct ifaddrs *list = NULL;

    if (getifaddrs(&list) != 0) {
        mini_printf("[DISCOVERY] getifaddrs failed\n");
        return false;
    }

    bool found = false;

    for (struct ifaddrs *ifa = list; ifa && !found; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET)
            continue;

        if ((ifa->ifa_flags & IFF_LOOPBACK) || !(ifa->ifa_flags & IFF_UP))
            continue;

        const struct sockaddr_in *sin = (const struct sockaddr_in *)ifa->ifa_addr;
        uint32_t a = ntohl(sin->sin_addr.s_addr);

        /* 169.254.0.0/16 */
        if ((a >> 16) == 0xA9FE)
            continue;

        subnet[0] = (uint8_t)(a >> 24);
        subnet[1] = (uint8_t)(a >> 16);
        subnet[2] = (uint8_t)(a >> 8);
        if (host)
            *host = (uint8_t)a;

        mini_printf("[DISCOVERY] interface %s\n", ifa->ifa_name);
        found = true;
    }

    freeifaddrs(list);
    return found;
}
