#include <gtest/gtest.h>

#include <limits>
#include <variant>

#include "message_dispatcher.hpp"
#include "test_helpers.hpp"

using namespace gs_bridge;
using namespace gs_bridge::protocol;
using namespace gs_bridge::testing;

namespace {

DecodedFrame MakeDecoded(uint8_t id, const Payload& payload = {}) {
  return DecodedFrame{id, payload};
}

}  // namespace

TEST(MessageDispatcherTest, RoutesAhrs) {
  const auto event = MessageDispatcher::Dispatch(
      MakeDecoded(msg_id::AHRS, MakeAhrsPayload(1500, -250, 9000, 123)), 1000);

  ASSERT_TRUE(std::holds_alternative<AhrsUpdated>(event));
  const auto& s = std::get<AhrsUpdated>(event).sample;
  EXPECT_FLOAT_EQ(s.roll, 15.0f);
  EXPECT_FLOAT_EQ(s.pitch, -2.5f);
  EXPECT_FLOAT_EQ(s.yaw, 90.0f);
  EXPECT_FLOAT_EQ(s.altitude, 12.3f);
  EXPECT_EQ(s.timestamp, 1000u);
  EXPECT_EQ(EventName(event), "ahrs");
}

TEST(MessageDispatcherTest, RoutesGps) {
  const auto event = MessageDispatcher::Dispatch(
      MakeDecoded(msg_id::GPS, MakeGpsPayload(481173000, 115166667, 1150, 1)),
      42);

  ASSERT_TRUE(std::holds_alternative<GpsUpdated>(event));
  const auto& fix = std::get<GpsUpdated>(event).fix;
  EXPECT_NEAR(fix.latitude, 48.1173, 1e-7);
  EXPECT_EQ(fix.swa, 1);
  EXPECT_EQ(fix.source, GpsSource::Binary);
}

TEST(MessageDispatcherTest, RoutesEveryPidAxis) {
  for (uint8_t id = 0; id < PID_AXIS_COUNT; ++id) {
    const auto event = MessageDispatcher::Dispatch(
        MakeDecoded(id, MakePidPayload(1.0f, 0.5f, 0.25f)), 7);

    ASSERT_TRUE(std::holds_alternative<PidAckReceived>(event))
        << "Axis id " << int(id);
    const auto& gains = std::get<PidAckReceived>(event).gains;
    EXPECT_EQ(gains.axis, static_cast<PidAxis>(id));
    EXPECT_FLOAT_EQ(gains.p, 1.0f);
    EXPECT_FLOAT_EQ(gains.d, 0.25f);
  }
}

TEST(MessageDispatcherTest, RoutesRemainingKinds) {
  Payload battery{};
  PutU16(battery, 0, 1260);
  battery[8] = 3;

  EXPECT_TRUE(std::holds_alternative<BatteryUpdated>(
      MessageDispatcher::Dispatch(MakeDecoded(msg_id::BATTERY, battery), 0)));
  EXPECT_TRUE(std::holds_alternative<EscUpdated>(
      MessageDispatcher::Dispatch(MakeDecoded(msg_id::ESC), 0)));
  EXPECT_TRUE(std::holds_alternative<FlightModeChanged>(
      MessageDispatcher::Dispatch(MakeDecoded(msg_id::FLIGHT_MODE), 0)));
  EXPECT_TRUE(std::holds_alternative<GpsEnhancedUpdated>(
      MessageDispatcher::Dispatch(
          MakeDecoded(msg_id::GPS_ENHANCED, MakeGpsEnhancedPayload(1, 2)), 0)));
}

TEST(MessageDispatcherTest, UnknownIdsAreReported) {
  for (uint8_t id : {uint8_t{0x06}, uint8_t{0x0F}, uint8_t{0x16},
                     uint8_t{0x20}, uint8_t{0xFF}}) {
    const auto event = MessageDispatcher::Dispatch(MakeDecoded(id), 0);
    ASSERT_TRUE(std::holds_alternative<UnknownMessage>(event))
        << "Id " << int(id);
    EXPECT_EQ(std::get<UnknownMessage>(event).message_id, id);
  }
}

TEST(MessageDispatcherTest, OutOfRangeBecomesRejected) {
  const auto ahrs = MessageDispatcher::Dispatch(
      MakeDecoded(msg_id::AHRS, MakeAhrsPayload(18001, 0, 0, 0)), 0);
  ASSERT_TRUE(std::holds_alternative<RecordRejected>(ahrs));
  EXPECT_EQ(std::get<RecordRejected>(ahrs).message_id, msg_id::AHRS);
  EXPECT_EQ(std::get<RecordRejected>(ahrs).error, PayloadError::OutOfRange);

  const auto pid = MessageDispatcher::Dispatch(
      MakeDecoded(0x02, MakePidPayload(
                            std::numeric_limits<float>::quiet_NaN(), 0, 0)),
      0);
  ASSERT_TRUE(std::holds_alternative<RecordRejected>(pid));
  EXPECT_EQ(std::get<RecordRejected>(pid).message_id, 0x02);
  EXPECT_EQ(EventName(pid), "rejected");
}

TEST(MessageDispatcherTest, NmeaFixBecomesGpsUpdate) {
  GpsFix fix;
  fix.latitude = 48.0;
  fix.longitude = 11.0;
  fix.source = GpsSource::Nmea;

  const auto event = MessageDispatcher::Dispatch(fix);
  ASSERT_TRUE(std::holds_alternative<GpsUpdated>(event));
  EXPECT_EQ(std::get<GpsUpdated>(event).fix.source, GpsSource::Nmea);
}
