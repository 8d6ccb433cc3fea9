/*
 * test_discovery.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Subnet scan for the Modbus TCP device
 */

#include <gtest/gtest.h>

#include <set>
#include <string>

#include "discovery.h"
#include "fakes/fake_modbus_hw.h"
#include "fakes/fake_platform.h"

static const uint8_t k_subnet[3] = { 192, 168, 1 };

static int g_abort_after = 0;

static bool abort_after_count(void)
{
    return fake_modbus_connect_count() >= g_abort_after;
}

class Discovery : public ::testing::Test {
protected:
    void SetUp() override
    {
        fake_platform_reset();
        fake_modbus_reset();
    }

    char host[32];
};

TEST(DiscoveryOrder, PriorityHostsFirstThenTheRest)
{
    uint8_t order[DISCOVERY_HOSTS];
    size_t n = discovery_order(order, sizeof(order));

    ASSERT_EQ((size_t)DISCOVERY_HOSTS, n);

    const uint8_t priority[] = { 1, 65, 100, 200, 2, 10, 50, 150, 254 };
    for (size_t i = 0; i < sizeof(priority); i++)
        EXPECT_EQ(priority[i], order[i]);

    /* remaining hosts ascending, skipping the ones already tried */
    EXPECT_EQ(3, order[9]);
    EXPECT_EQ(4, order[10]);

    std::set<uint8_t> seen(order, order + n);
    EXPECT_EQ((size_t)DISCOVERY_HOSTS, seen.size());
    EXPECT_EQ(0u, seen.count(0));
    EXPECT_EQ(0u, seen.count(255));
}

TEST(DiscoveryOrder, RespectsCapacity)
{
    uint8_t order[4];
    EXPECT_EQ(4u, discovery_order(order, sizeof(order)));
    EXPECT_EQ(200, order[3]);
}

TEST_F(Discovery, FindsPriorityHost)
{
    fake_modbus_set_only_host("192.168.1.65");

    ASSERT_TRUE(discovery_run(k_subnet, 502, host, sizeof(host), NULL));
    EXPECT_STREQ("192.168.1.65", host);

    ASSERT_EQ(2u, fake_modbus_connect_hosts().size());
    EXPECT_EQ("192.168.1.1", fake_modbus_connect_hosts()[0]);
    EXPECT_FALSE(fake_modbus_is_open());
    EXPECT_NE(std::string::npos, fake_console_text().find("(priority scan)"));
}

TEST_F(Discovery, FallsBackToFullScan)
{
    fake_modbus_set_only_host("192.168.1.77");

    ASSERT_TRUE(discovery_run(k_subnet, 502, host, sizeof(host), NULL));
    EXPECT_STREQ("192.168.1.77", host);

    /* 9 priority hosts, then 3..77 minus 10, 50, 65 */
    EXPECT_EQ(81u, fake_modbus_connect_hosts().size());
    EXPECT_NE(std::string::npos, fake_console_text().find("(full scan)"));
}

TEST_F(Discovery, NothingAnswers)
{
    fake_modbus_set_reachable(false);

    EXPECT_FALSE(discovery_run(k_subnet, 502, host, sizeof(host), NULL));
    EXPECT_EQ(DISCOVERY_HOSTS, fake_modbus_connect_count());
    EXPECT_NE(std::string::npos, fake_console_text().find("no responder"));
}

TEST_F(Discovery, ProbeNeedsModbusAnswer)
{
    EXPECT_TRUE(discovery_probe("192.168.1.65", 502, DISCOVERY_PROBE_MS));
    EXPECT_FALSE(fake_modbus_is_open());

    /* open port but not a GX device */
    fake_modbus_remove_reg(100, 800);
    EXPECT_FALSE(discovery_probe("192.168.1.65", 502, DISCOVERY_PROBE_MS));
    EXPECT_FALSE(fake_modbus_is_open());
}

TEST_F(Discovery, HostBufferTooSmall)
{
    char tiny[8];
    EXPECT_FALSE(discovery_run(k_subnet, 502, tiny, sizeof(tiny), NULL));
}

TEST_F(Discovery, AbortStopsScanBeforeNextProbe)
{
    fake_modbus_set_reachable(false);
    g_abort_after = 3;

    EXPECT_FALSE(discovery_run(k_subnet, 502, host, sizeof(host), abort_after_count));
    EXPECT_EQ(3, fake_modbus_connect_count());
    EXPECT_NE(std::string::npos, fake_console_text().find("aborted after 3 probes"));
    EXPECT_EQ(std::string::npos, fake_console_text().find("no responder"));
}

TEST_F(Discovery, AbortBeforeFirstProbe)
{
    g_abort_after = 0;

    EXPECT_FALSE(discovery_run(k_subnet, 502, host, sizeof(host), abort_after_count));
    EXPECT_EQ(0, fake_modbus_connect_count());
}
