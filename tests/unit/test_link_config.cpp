#include <gtest/gtest.h>

#include "link_config.hpp"

using namespace gs_bridge;

TEST(LinkConfigTest, DefaultsAreValid) {
  LinkConfig cfg;
  EXPECT_TRUE(cfg.IsValid());
  EXPECT_TRUE(cfg.port.empty());
  EXPECT_EQ(cfg.baud, 115200u);
  EXPECT_EQ(cfg.max_reconnect_attempts, 5u);
  EXPECT_EQ(cfg.reconnect_backoff_ms, 2000u);
  EXPECT_EQ(cfg.read_timeout_ms, 100u);
  EXPECT_FLOAT_EQ(cfg.nmea_battery_voltage, 11.5f);
}

TEST(LinkConfigTest, RejectsOutOfRange) {
  LinkConfig cfg;
  cfg.max_reconnect_attempts = 0;
  EXPECT_FALSE(cfg.IsValid());

  cfg.Reset();
  cfg.max_reconnect_attempts = 21;
  EXPECT_FALSE(cfg.IsValid());

  cfg.Reset();
  cfg.reconnect_backoff_ms = 99;
  EXPECT_FALSE(cfg.IsValid());

  cfg.Reset();
  cfg.read_timeout_ms = 1001;
  EXPECT_FALSE(cfg.IsValid());

  cfg.Reset();
  cfg.baud = 0;
  EXPECT_FALSE(cfg.IsValid());
}

TEST(LinkConfigTest, ClampBringsIntoRange) {
  LinkConfig cfg;
  cfg.baud = 0;
  cfg.max_reconnect_attempts = 100;
  cfg.reconnect_backoff_ms = 5;
  cfg.read_timeout_ms = 0;
  cfg.nmea_battery_voltage = -1.0f;

  cfg.Clamp();
  EXPECT_TRUE(cfg.IsValid());
  EXPECT_EQ(cfg.baud, 115200u);
  EXPECT_EQ(cfg.max_reconnect_attempts, 20u);
  EXPECT_EQ(cfg.reconnect_backoff_ms, 100u);
  EXPECT_EQ(cfg.read_timeout_ms, 1u);
  EXPECT_FLOAT_EQ(cfg.nmea_battery_voltage, 0.0f);
}

TEST(LinkConfigTest, ResetRestoresDefaults) {
  LinkConfig cfg;
  cfg.port = "/dev/ttyUSB3";
  cfg.baud = 57600;
  cfg.reconnect_backoff_ms = 500;

  cfg.Reset();
  EXPECT_TRUE(cfg.port.empty());
  EXPECT_EQ(cfg.baud, 115200u);
  EXPECT_EQ(cfg.reconnect_backoff_ms, 2000u);
}
