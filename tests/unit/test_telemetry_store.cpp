#include <gtest/gtest.h>

#include <thread>

#include "telemetry_store.hpp"
#include "test_helpers.hpp"

using namespace gs_bridge;
using namespace gs_bridge::protocol;

namespace {

AhrsUpdated Ahrs(uint32_t timestamp, float roll = 0.0f) {
  AhrsSample s;
  s.roll = roll;
  s.timestamp = timestamp;
  return AhrsUpdated{s};
}

GpsUpdated Gps(double lat, double lon) {
  GpsFix fix;
  fix.latitude = lat;
  fix.longitude = lon;
  return GpsUpdated{fix};
}

GpsEnhancedUpdated Home(double lat, double lon) {
  GpsEnhancedStatus st;
  st.home_lat = lat;
  st.home_lon = lon;
  return GpsEnhancedUpdated{st};
}

}  // namespace

TEST(TelemetryStoreTest, EmptyUntilFirstMessage) {
  TelemetryStore store;
  const auto snap = store.Snapshot();

  EXPECT_FALSE(snap.ahrs.has_value());
  EXPECT_FALSE(snap.gps.has_value());
  EXPECT_FALSE(snap.battery.has_value());
  EXPECT_FALSE(snap.esc.has_value());
  EXPECT_FALSE(snap.flight_mode.has_value());
  EXPECT_FALSE(snap.gps_enhanced.has_value());
  EXPECT_FALSE(snap.distance_to_home_m.has_value());
  EXPECT_EQ(snap.ahrs_count, 0u);
  for (const auto& gains : snap.pid_gains) {
    EXPECT_FALSE(gains.has_value());
  }
}

TEST(TelemetryStoreTest, KeepsLatestAhrsAndRate) {
  TelemetryStore store;
  store.OnTelemetry(Ahrs(1000, 1.0f));
  EXPECT_FLOAT_EQ(store.Snapshot().ahrs_rate_hz, 0.0f)
      << "Rate needs two samples";

  store.OnTelemetry(Ahrs(1020, 2.0f));
  const auto snap = store.Snapshot();
  ASSERT_TRUE(snap.ahrs.has_value());
  EXPECT_FLOAT_EQ(snap.ahrs->roll, 2.0f);
  EXPECT_FLOAT_EQ(snap.ahrs_rate_hz, 50.0f);
  EXPECT_EQ(snap.ahrs_count, 2u);
}

TEST(TelemetryStoreTest, SameTimestampKeepsPreviousRate) {
  TelemetryStore store;
  store.OnTelemetry(Ahrs(1000));
  store.OnTelemetry(Ahrs(1010));
  store.OnTelemetry(Ahrs(1010));
  EXPECT_FLOAT_EQ(store.Snapshot().ahrs_rate_hz, 100.0f);
}

TEST(TelemetryStoreTest, AhrsRateSurvivesMillisecondWraparound) {
  TelemetryStore store;
  store.OnTelemetry(Ahrs(0xFFFFFFF6u));
  store.OnTelemetry(Ahrs(0x0000000Au));
  EXPECT_FLOAT_EQ(store.Snapshot().ahrs_rate_hz, 50.0f);
}

TEST(TelemetryStoreTest, PidGainsStoredPerAxis) {
  TelemetryStore store;
  PidGainRecord rec;
  rec.axis = PidAxis::YawRate;
  rec.p = 0.8f;
  store.OnTelemetry(PidAckReceived{rec});

  auto yaw = store.GetPidGains(PidAxis::YawRate);
  ASSERT_TRUE(yaw.has_value());
  EXPECT_FLOAT_EQ(yaw->p, 0.8f);
  EXPECT_FALSE(store.GetPidGains(PidAxis::RollInner).has_value());
}

TEST(TelemetryStoreTest, UnknownCountedRejectedIgnored) {
  TelemetryStore store;
  store.OnTelemetry(UnknownMessage{0x42});
  store.OnTelemetry(UnknownMessage{0x43});
  store.OnTelemetry(RecordRejected{msg_id::AHRS, PayloadError::OutOfRange});

  const auto snap = store.Snapshot();
  EXPECT_EQ(snap.unknown_messages, 2u);
  EXPECT_FALSE(snap.ahrs.has_value());
}

TEST(TelemetryStoreTest, DistanceToHome) {
  TelemetryStore store;
  store.OnTelemetry(Gps(48.001, 11.0));
  EXPECT_FALSE(store.Snapshot().distance_to_home_m.has_value())
      << "Home not known yet";

  store.OnTelemetry(Home(48.0, 11.0));
  auto dist = store.Snapshot().distance_to_home_m;
  ASSERT_TRUE(dist.has_value());
  EXPECT_NEAR(*dist, 111.0f, 0.01f);

  store.OnTelemetry(Gps(48.0, 11.002));
  dist = store.Snapshot().distance_to_home_m;
  ASSERT_TRUE(dist.has_value());
  EXPECT_NEAR(*dist, 222.0f, 0.01f);
}

TEST(TelemetryStoreTest, DistanceNeedsHomeAndPosition) {
  TelemetryStore store;
  store.OnTelemetry(Home(0.0, 0.0));
  store.OnTelemetry(Gps(48.0, 11.0));
  EXPECT_FALSE(store.Snapshot().distance_to_home_m.has_value());

  store.OnTelemetry(Home(48.0, 11.0));
  EXPECT_TRUE(store.Snapshot().distance_to_home_m.has_value());

  // Позиция без фикса сбрасывает оценку
  store.OnTelemetry(Gps(0.0, 0.0));
  EXPECT_FALSE(store.Snapshot().distance_to_home_m.has_value());
}

TEST(TelemetryStoreTest, ClearForgetsEverything) {
  TelemetryStore store;
  store.OnTelemetry(Ahrs(5));
  store.OnTelemetry(Gps(1.0, 2.0));
  store.Clear();

  const auto snap = store.Snapshot();
  EXPECT_FALSE(snap.ahrs.has_value());
  EXPECT_FALSE(snap.gps.has_value());
  EXPECT_EQ(snap.ahrs_count, 0u);
}

TEST(TelemetryStoreTest, ConcurrentWriterAndReader) {
  TelemetryStore store;
  constexpr uint32_t kSamples = 2000;

  std::thread writer([&] {
    for (uint32_t t = 1; t <= kSamples; ++t) {
      store.OnTelemetry(Ahrs(t));
    }
  });
  for (int k = 0; k < 500; ++k) {
    const auto snap = store.Snapshot();
    if (snap.ahrs) {
      EXPECT_EQ(snap.ahrs->timestamp, snap.ahrs_count);
    }
  }
  writer.join();

  EXPECT_EQ(store.Snapshot().ahrs_count, kSamples);
}
