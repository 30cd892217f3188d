#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <limits>

#include "payload_decoder.hpp"
#include "test_helpers.hpp"

using namespace gs_bridge;
using namespace gs_bridge::protocol;
using namespace gs_bridge::testing;

// ═══════════════════════════════════════════════════════════════════════════
// AHRS
// ═══════════════════════════════════════════════════════════════════════════

TEST(PayloadDecoderTest, DecodeAhrsScalesValues) {
  Payload p = MakeAhrsPayload(1234, -567, 27050, -15);
  PutI16(p, 8, 1000);   // roll_sp 10.00
  PutI16(p, 10, -500);  // pitch_sp -5.00
  PutU16(p, 12, 9000);  // yaw_sp 90.00
  PutI16(p, 14, 200);   // alt_sp 20.0

  auto result = PayloadDecoder::DecodeAhrs(p, 4200);
  ASSERT_TRUE(IsOk(result));

  const AhrsSample& s = GetValue(result);
  EXPECT_FLOAT_EQ(s.roll, 12.34f);
  EXPECT_FLOAT_EQ(s.pitch, -5.67f);
  EXPECT_FLOAT_EQ(s.yaw, 270.5f);
  EXPECT_FLOAT_EQ(s.altitude, -1.5f);
  EXPECT_FLOAT_EQ(s.roll_sp, 10.0f);
  EXPECT_FLOAT_EQ(s.pitch_sp, -5.0f);
  EXPECT_FLOAT_EQ(s.yaw_sp, 90.0f);
  EXPECT_FLOAT_EQ(s.altitude_sp, 20.0f);
  EXPECT_EQ(s.timestamp, 4200u);
}

TEST(PayloadDecoderTest, AhrsRollBoundary) {
  auto at_limit = PayloadDecoder::DecodeAhrs(MakeAhrsPayload(18000, 0, 0, 0), 0);
  ASSERT_TRUE(IsOk(at_limit)) << "Exactly 180 degrees should be accepted";
  EXPECT_FLOAT_EQ(GetValue(at_limit).roll, 180.0f);

  auto over = PayloadDecoder::DecodeAhrs(MakeAhrsPayload(18001, 0, 0, 0), 0);
  ASSERT_TRUE(IsError(over));
  EXPECT_EQ(GetError(over), PayloadError::OutOfRange);

  auto negative = PayloadDecoder::DecodeAhrs(MakeAhrsPayload(-18001, 0, 0, 0), 0);
  EXPECT_TRUE(IsError(negative));
}

TEST(PayloadDecoderTest, AhrsPitchAndYawBoundary) {
  EXPECT_TRUE(IsOk(PayloadDecoder::DecodeAhrs(MakeAhrsPayload(0, -18000, 36000, 0), 0)));
  EXPECT_TRUE(IsError(PayloadDecoder::DecodeAhrs(MakeAhrsPayload(0, 18001, 0, 0), 0)));
  EXPECT_TRUE(IsError(PayloadDecoder::DecodeAhrs(MakeAhrsPayload(0, 0, 36001, 0), 0)));
}

TEST(PayloadDecoderTest, AhrsShortPayloadCopiesActualsToSetpoints) {
  const Payload full = MakeAhrsPayload(100, 200, 300, 40);
  auto result = PayloadDecoder::DecodeAhrs(std::span<const uint8_t>(full).first(8), 0);
  ASSERT_TRUE(IsOk(result));
  EXPECT_FLOAT_EQ(GetValue(result).roll_sp, 1.0f);
  EXPECT_FLOAT_EQ(GetValue(result).altitude_sp, 4.0f);

  auto too_short = PayloadDecoder::DecodeAhrs(std::span<const uint8_t>(full).first(7), 0);
  ASSERT_TRUE(IsError(too_short));
  EXPECT_EQ(GetError(too_short), PayloadError::TooShort);
}

// ═══════════════════════════════════════════════════════════════════════════
// GPS
// ═══════════════════════════════════════════════════════════════════════════

TEST(PayloadDecoderTest, DecodeGps) {
  auto result = PayloadDecoder::DecodeGps(
      MakeGpsPayload(481173000, -1151666670, 1185, 1, 2, 0), 99);
  ASSERT_TRUE(IsOk(result));

  const GpsFix& fix = GetValue(result);
  EXPECT_NEAR(fix.latitude, 48.1173, 1e-7);
  EXPECT_NEAR(fix.longitude, -115.166667, 1e-7);
  EXPECT_FLOAT_EQ(fix.battery_voltage, 11.85f);
  EXPECT_EQ(fix.swa, 1);
  EXPECT_EQ(fix.swc, 2);
  EXPECT_EQ(fix.failsafe, 0);
  EXPECT_EQ(fix.fix_quality, 1) << "Non-zero lat and lon means a fix";
  EXPECT_EQ(fix.satellites, 0);
  EXPECT_FLOAT_EQ(fix.altitude, 0.0f);
  EXPECT_EQ(fix.source, GpsSource::Binary);
  EXPECT_EQ(fix.timestamp, 99u);
}

TEST(PayloadDecoderTest, GpsZeroPositionHasNoFix) {
  auto result = PayloadDecoder::DecodeGps(MakeGpsPayload(0, 115000000, 1100), 0);
  ASSERT_TRUE(IsOk(result));
  EXPECT_EQ(GetValue(result).fix_quality, 0);
}

TEST(PayloadDecoderTest, GpsRejectsOutOfRange) {
  auto bad_lat = PayloadDecoder::DecodeGps(MakeGpsPayload(900000001, 0, 0), 0);
  ASSERT_TRUE(IsError(bad_lat));
  EXPECT_EQ(GetError(bad_lat), PayloadError::OutOfRange);

  auto bad_lon = PayloadDecoder::DecodeGps(MakeGpsPayload(0, -1800000001, 0), 0);
  EXPECT_TRUE(IsError(bad_lon));

  EXPECT_TRUE(IsOk(PayloadDecoder::DecodeGps(MakeGpsPayload(-900000000, 1800000000, 0), 0)));
}

TEST(PayloadDecoderTest, GpsFailsafeHelpers) {
  auto result = PayloadDecoder::DecodeGps(MakeGpsPayload(1, 1, 340, 0, 0, 1), 0);
  ASSERT_TRUE(IsOk(result));
  EXPECT_TRUE(GetValue(result).IsFailsafeTriggered());
  EXPECT_TRUE(GetValue(result).IsLowBattery());
  EXPECT_NEAR(GetValue(result).BatteryPercentage(), 33.33f, 0.01f);
}

// ═══════════════════════════════════════════════════════════════════════════
// PID
// ═══════════════════════════════════════════════════════════════════════════

TEST(PayloadDecoderTest, DecodePidGain) {
  auto result = PayloadDecoder::DecodePidGain(
      PidAxis::RollOuter, MakePidPayload(4.5f, 0.02f, 0.0f), 7);
  ASSERT_TRUE(IsOk(result));
  EXPECT_EQ(GetValue(result).axis, PidAxis::RollOuter);
  EXPECT_FLOAT_EQ(GetValue(result).p, 4.5f);
  EXPECT_FLOAT_EQ(GetValue(result).i, 0.02f);
  EXPECT_FLOAT_EQ(GetValue(result).d, 0.0f);
}

TEST(PayloadDecoderTest, PidRejectsNonFiniteAndLarge) {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const float inf = std::numeric_limits<float>::infinity();

  EXPECT_TRUE(IsError(PayloadDecoder::DecodePidGain(
      PidAxis::RollInner, MakePidPayload(nan, 0, 0), 0)));
  EXPECT_TRUE(IsError(PayloadDecoder::DecodePidGain(
      PidAxis::RollInner, MakePidPayload(0, -inf, 0), 0)));
  EXPECT_TRUE(IsError(PayloadDecoder::DecodePidGain(
      PidAxis::RollInner, MakePidPayload(0, 0, 1000.5f), 0)));
  EXPECT_TRUE(IsOk(PayloadDecoder::DecodePidGain(
      PidAxis::RollInner, MakePidPayload(-1000.0f, 1000.0f, 0), 0)));
}

// ═══════════════════════════════════════════════════════════════════════════
// Battery, ESC, Flight mode, Enhanced GPS
// ═══════════════════════════════════════════════════════════════════════════

TEST(PayloadDecoderTest, DecodeBattery) {
  Payload p{};
  PutU16(p, 0, 1480);   // 14.80 V
  PutI16(p, 2, -250);   // -2.50 A
  PutU32(p, 4, 1234);
  p[8] = 4;
  PutU16(p, 9, 2200);

  auto result = PayloadDecoder::DecodeBattery(p, 0);
  ASSERT_TRUE(IsOk(result));
  const BatteryStatus& b = GetValue(result);
  EXPECT_FLOAT_EQ(b.voltage, 14.8f);
  EXPECT_FLOAT_EQ(b.current, -2.5f);
  EXPECT_EQ(b.consumption_mah, 1234u);
  EXPECT_EQ(b.cells, 4);
  EXPECT_EQ(b.remaining_capacity, 2200);
  EXPECT_FLOAT_EQ(b.VoltagePerCell(), 3.7f);
  EXPECT_FLOAT_EQ(b.EstimatedFlightTimeMin(), 0.0f)
      << "No estimate for negative current";
}

TEST(PayloadDecoderTest, BatteryFlightTimeEstimate) {
  BatteryStatus b;
  b.current = 10.0f;
  b.remaining_capacity = 2000;
  EXPECT_FLOAT_EQ(b.EstimatedFlightTimeMin(), 12.0f);

  b.cells = 0;
  EXPECT_FLOAT_EQ(b.VoltagePerCell(), 0.0f);
}

TEST(PayloadDecoderTest, DecodeEsc) {
  Payload p{};
  for (uint8_t m = 0; m < 4; ++m) {
    p[m * 3] = static_cast<uint8_t>(40 + m);
    p[m * 3 + 1] = 148;  // 14.8 V
    p[m * 3 + 2] = static_cast<uint8_t>(50 + m);
  }

  auto result = PayloadDecoder::DecodeEsc(p, 0);
  ASSERT_TRUE(IsOk(result));
  const EscStatus& esc = GetValue(result);
  for (size_t m = 0; m < ESC_MOTOR_COUNT; ++m) {
    EXPECT_EQ(esc.per_motor[m].temperature, static_cast<uint8_t>(40 + m));
    EXPECT_FLOAT_EQ(esc.per_motor[m].voltage, 14.8f);
    EXPECT_FLOAT_EQ(esc.per_motor[m].current, (50.0f + m) / 10.0f);
    EXPECT_EQ(esc.per_motor[m].rpm, 0u);
  }
}

TEST(PayloadDecoderTest, DecodeFlightMode) {
  Payload p{};
  p[0] = 2;                  // ALT_HOLD
  p[1] = 0x01 | (2u << 1);   // armed, ARMED

  auto result = PayloadDecoder::DecodeFlightMode(p, 0);
  ASSERT_TRUE(IsOk(result));
  EXPECT_EQ(GetValue(result).mode, FlightMode::AltHold);
  EXPECT_TRUE(GetValue(result).armed);
  EXPECT_EQ(GetValue(result).arming_state, ArmingState::Armed);
  EXPECT_EQ(GetValue(result).ModeName(), "ALT_HOLD");
  EXPECT_EQ(GetValue(result).ArmingStateName(), "ARMED");
}

TEST(PayloadDecoderTest, UnknownFlightMode) {
  Payload p{};
  p[0] = 9;
  p[1] = 3u << 1;

  auto result = PayloadDecoder::DecodeFlightMode(p, 0);
  ASSERT_TRUE(IsOk(result));
  EXPECT_EQ(GetValue(result).mode, FlightMode::Unknown);
  EXPECT_EQ(GetValue(result).ModeName(), "UNKNOWN");
  EXPECT_FALSE(GetValue(result).armed);
  EXPECT_EQ(GetValue(result).ArmingStateName(), "DISARMING");
}

TEST(PayloadDecoderTest, DecodeGpsEnhanced) {
  auto result = PayloadDecoder::DecodeGpsEnhanced(
      MakeGpsEnhancedPayload(481170000, 115160000), 0);
  ASSERT_TRUE(IsOk(result));

  const GpsEnhancedStatus& g = GetValue(result);
  EXPECT_EQ(g.fix_type, 3);
  EXPECT_EQ(g.satellites_visible, 12);
  EXPECT_FLOAT_EQ(g.hdop, 0.9f);
  EXPECT_FLOAT_EQ(g.vdop, 1.2f);
  EXPECT_NEAR(g.home_lat, 48.117, 1e-7);
  EXPECT_NEAR(g.home_lon, 11.516, 1e-7);
  EXPECT_FLOAT_EQ(g.home_alt, 45.5f);
  EXPECT_TRUE(g.IsHomeSet());
}

TEST(PayloadDecoderTest, TooShortPayloads) {
  const std::array<uint8_t, 1> one{0};
  EXPECT_EQ(GetError(PayloadDecoder::DecodeGps(one, 0)), PayloadError::TooShort);
  EXPECT_EQ(GetError(PayloadDecoder::DecodePidGain(PidAxis::YawRate, one, 0)),
            PayloadError::TooShort);
  EXPECT_EQ(GetError(PayloadDecoder::DecodeBattery(one, 0)), PayloadError::TooShort);
  EXPECT_EQ(GetError(PayloadDecoder::DecodeEsc(one, 0)), PayloadError::TooShort);
  EXPECT_EQ(GetError(PayloadDecoder::DecodeFlightMode(one, 0)), PayloadError::TooShort);
  EXPECT_EQ(GetError(PayloadDecoder::DecodeGpsEnhanced(one, 0)), PayloadError::TooShort);
}
