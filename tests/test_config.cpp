/*
 * test_config.cpp
 *
 * Project: Solar Display Controller
 * Purpose: Config defaults, JSON parsing and formatting
 */

#include <gtest/gtest.h>

#include <string>
#include <string.h>

#include "config.h"
#include "fakes/fake_platform.h"

class Config : public ::testing::Test {
protected:
    void SetUp() override
    {
        fake_platform_reset();
        config_defaults(&cfg);
    }

    bool logged_reject(const char *key)
    {
        std::string line = std::string("[CONFIG] ignoring invalid value for \"") + key + "\"";
        return fake_console_text().find(line) != std::string::npos;
    }

    struct config cfg;
};

TEST_F(Config, Defaults)
{
    EXPECT_STREQ("", cfg.device_host);
    EXPECT_EQ(502, cfg.device_port);
    EXPECT_EQ(508450, cfg.latitude_e4);
    EXPECT_EQ(74830, cfg.longitude_e4);
    EXPECT_EQ(2, cfg.display_rotation);
    EXPECT_EQ(1, cfg.i2c_bus);
    EXPECT_EQ(0x3C, cfg.i2c_address);
    EXPECT_STREQ("/dev/gpiochip0", cfg.gpio_chip);
    EXPECT_EQ(17, cfg.gpio_generator);
    EXPECT_EQ(27, cfg.gpio_multiplus);
    EXPECT_EQ(24, cfg.gpio_button);
    EXPECT_EQ(1000u, cfg.poll_period_ms);
    EXPECT_EQ(5000u, cfg.link_timeout_ms);
    EXPECT_EQ(60000u, cfg.watchdog_ms);
    EXPECT_EQ(5000u, cfg.switch_confirm_ms);
    EXPECT_EQ(10, cfg.idle_reset_ticks);
    EXPECT_EQ(5, cfg.yield_unit_count);
    EXPECT_EQ(238, cfg.yield_unit_ids[0]);
    EXPECT_EQ(223, cfg.yield_unit_ids[4]);
}

TEST_F(Config, ParsesCurrentKeys)
{
    const char *text =
        "{\n"
        "  \"device_host\": \"192.168.1.65\",\n"
        "  \"device_port\": 5020,\n"
        "  \"latitude\": 48.1372,\n"
        "  \"longitude\": -11.5755,\n"
        "  \"display_rotation\": 0,\n"
        "  \"gpio_button\": 22,\n"
        "  \"switch_confirm_ms\": 3000,\n"
        "  \"forecast_dir\": \"/home/pi\",\n"
        "  \"yield_unit_ids\": [238, 239]\n"
        "}\n";

    ASSERT_TRUE(config_parse_json(text, &cfg));

    EXPECT_STREQ("192.168.1.65", cfg.device_host);
    EXPECT_EQ(5020, cfg.device_port);
    EXPECT_EQ(481372, cfg.latitude_e4);
    EXPECT_EQ(-115755, cfg.longitude_e4);
    EXPECT_EQ(0, cfg.display_rotation);
    EXPECT_EQ(22, cfg.gpio_button);
    EXPECT_EQ(3000u, cfg.switch_confirm_ms);
    EXPECT_STREQ("/home/pi", cfg.forecast_dir);
    EXPECT_EQ(2, cfg.yield_unit_count);
    EXPECT_EQ(239, cfg.yield_unit_ids[1]);

    /* untouched */
    EXPECT_EQ(0x3C, cfg.i2c_address);
    EXPECT_EQ(60000u, cfg.watchdog_ms);
}

TEST_F(Config, AcceptsLegacyKeys)
{
    const char *text =
        "{\"cerbo_host\": \"10.0.0.5\", \"cerbo_port\": 503,"
        " \"display_rotate\": 0, \"i2c_port\": 3}";

    ASSERT_TRUE(config_parse_json(text, &cfg));

    EXPECT_STREQ("10.0.0.5", cfg.device_host);
    EXPECT_EQ(503, cfg.device_port);
    EXPECT_EQ(0, cfg.display_rotation);
    EXPECT_EQ(3, cfg.i2c_bus);
}

TEST_F(Config, NullHostMeansDiscover)
{
    strcpy(cfg.device_host, "192.168.1.65");

    ASSERT_TRUE(config_parse_json("{\"device_host\": null}", &cfg));
    EXPECT_STREQ("", cfg.device_host);
}

TEST_F(Config, I2cAddressHexOrInteger)
{
    ASSERT_TRUE(config_parse_json("{\"i2c_address\": \"0x3D\"}", &cfg));
    EXPECT_EQ(0x3D, cfg.i2c_address);

    ASSERT_TRUE(config_parse_json("{\"i2c_address\": 60}", &cfg));
    EXPECT_EQ(0x3C, cfg.i2c_address);

    ASSERT_TRUE(config_parse_json("{\"i2c_address\": \"0x80\"}", &cfg));
    EXPECT_EQ(0x3C, cfg.i2c_address);
    EXPECT_TRUE(logged_reject("i2c_address"));
}

TEST_F(Config, InvalidValuesKeepDefaults)
{
    const char *text =
        "{\"display_rotation\": 1, \"device_port\": 70000,"
        " \"latitude\": 90.5, \"poll_period_ms\": \"fast\","
        " \"gpio_chip\": 7, \"yield_unit_ids\": [238, 0]}";

    ASSERT_TRUE(config_parse_json(text, &cfg));

    EXPECT_EQ(2, cfg.display_rotation);
    EXPECT_EQ(502, cfg.device_port);
    EXPECT_EQ(508450, cfg.latitude_e4);
    EXPECT_EQ(1000u, cfg.poll_period_ms);
    EXPECT_STREQ("/dev/gpiochip0", cfg.gpio_chip);
    EXPECT_EQ(5, cfg.yield_unit_count);

    EXPECT_TRUE(logged_reject("display_rotation"));
    EXPECT_TRUE(logged_reject("device_port"));
    EXPECT_TRUE(logged_reject("latitude"));
    EXPECT_TRUE(logged_reject("poll_period_ms"));
    EXPECT_TRUE(logged_reject("gpio_chip"));
    EXPECT_TRUE(logged_reject("yield_unit_ids"));
}

TEST_F(Config, TooManyYieldUnitsRejected)
{
    ASSERT_TRUE(config_parse_json(
        "{\"yield_unit_ids\": [1, 2, 3, 4, 5, 6, 7, 8, 9]}", &cfg));

    EXPECT_EQ(5, cfg.yield_unit_count);
    EXPECT_TRUE(logged_reject("yield_unit_ids"));
}

TEST_F(Config, UnknownKeysSkipped)
{
    const char *text =
        "{\"comment\": \"x \\\"quoted\\\" y\","
        " \"nested\": {\"a\": [1, 2.5, {\"b\": null}], \"c\": true},"
        " \"a_very_long_key_name_that_does_not_fit_anywhere\": false,"
        " \"device_port\": 503}";

    ASSERT_TRUE(config_parse_json(text, &cfg));
    EXPECT_EQ(503, cfg.device_port);
}

TEST_F(Config, SyntaxErrorsFail)
{
    EXPECT_FALSE(config_parse_json("", &cfg));
    EXPECT_FALSE(config_parse_json("[]", &cfg));
    EXPECT_FALSE(config_parse_json("{\"device_port\": 503", &cfg));
    EXPECT_FALSE(config_parse_json("{\"device_port\" 503}", &cfg));
    EXPECT_FALSE(config_parse_json("{\"device_port\": }", &cfg));
    EXPECT_FALSE(config_parse_json("\"device_port\"", &cfg));

    EXPECT_TRUE(config_parse_json(" { } ", &cfg));
}

TEST_F(Config, ExponentNumbersAccepted)
{
    ASSERT_TRUE(config_parse_json(
        "{\"device_host\":\"10.0.0.5\",\"latitude\":5.0845e1}", &cfg));

    EXPECT_STREQ("10.0.0.5", cfg.device_host);
    EXPECT_EQ(508450, cfg.latitude_e4);

    ASSERT_TRUE(config_parse_json("{\"device_port\": 5e2}", &cfg));
    EXPECT_EQ(500, cfg.device_port);

    /* not a whole number */
    ASSERT_TRUE(config_parse_json("{\"device_port\": 5.025e2}", &cfg));
    EXPECT_EQ(500, cfg.device_port);
    EXPECT_TRUE(logged_reject("device_port"));
}

TEST_F(Config, BooleanIsNotANumber)
{
    ASSERT_TRUE(config_parse_json("{\"gpio_button\": true, \"i2c_bus\": false}", &cfg));

    EXPECT_EQ(24, cfg.gpio_button);
    EXPECT_EQ(1, cfg.i2c_bus);
    EXPECT_TRUE(logged_reject("gpio_button"));
    EXPECT_TRUE(logged_reject("i2c_bus"));
}

TEST_F(Config, FormatThenParseRestoresValues)
{
    strcpy(cfg.device_host, "192.168.1.65");
    strcpy(cfg.forecast_dir, "/home/pi");
    cfg.latitude_e4      = -338688;
    cfg.longitude_e4     = 1512093;
    cfg.display_rotation = 0;
    cfg.i2c_address      = 0x3D;
    cfg.watchdog_ms      = 120000;
    cfg.yield_unit_ids[0] = 100;
    cfg.yield_unit_count  = 1;

    char text[CONFIG_TEXT_MAX];
    ASSERT_TRUE(config_format_json(&cfg, text, sizeof(text)));

    EXPECT_NE(nullptr, strstr(text, "\"i2c_address\": \"0x3D\""));
    EXPECT_NE(nullptr, strstr(text, "\"yield_unit_ids\": ["));

    struct config back;
    config_defaults(&back);
    ASSERT_TRUE(config_parse_json(text, &back));

    EXPECT_STREQ(cfg.device_host, back.device_host);
    EXPECT_STREQ(cfg.forecast_dir, back.forecast_dir);
    EXPECT_EQ(cfg.latitude_e4, back.latitude_e4);
    EXPECT_EQ(cfg.longitude_e4, back.longitude_e4);
    EXPECT_EQ(cfg.display_rotation, back.display_rotation);
    EXPECT_EQ(cfg.i2c_address, back.i2c_address);
    EXPECT_EQ(cfg.watchdog_ms, back.watchdog_ms);
    EXPECT_EQ(1, back.yield_unit_count);
    EXPECT_EQ(100, back.yield_unit_ids[0]);
}

TEST_F(Config, EmptyHostFormatsAsNull)
{
    char text[CONFIG_TEXT_MAX];
    ASSERT_TRUE(config_format_json(&cfg, text, sizeof(text)));

    EXPECT_NE(nullptr, strstr(text, "\"device_host\": null"));
    EXPECT_NE(nullptr, strstr(text, "\"forecast_dir\": null"));
}

TEST_F(Config, FormatReportsOverflow)
{
    char text[64];
    EXPECT_FALSE(config_format_json(&cfg, text, sizeof(text)));
}
