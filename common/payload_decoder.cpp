#include "payload_decoder.hpp"

#include <cmath>
#include <cstring>

namespace gs_bridge {

using protocol::PayloadError;

namespace {

using Limits = config::ValidationLimits;

constexpr size_t AHRS_MIN_SIZE = 8;
constexpr size_t AHRS_FULL_SIZE = 16;
constexpr size_t GPS_MIN_SIZE = 13;
constexpr size_t PID_MIN_SIZE = 12;
constexpr size_t BATTERY_MIN_SIZE = 11;
constexpr size_t ESC_MIN_SIZE = ESC_MOTOR_COUNT * 3;
constexpr size_t FLIGHT_MODE_MIN_SIZE = 2;
constexpr size_t GPS_ENHANCED_MIN_SIZE = 16;

uint16_t ReadU16(std::span<const uint8_t> b, size_t at) noexcept {
  return static_cast<uint16_t>(b[at] | (b[at + 1] << 8));
}

int16_t ReadI16(std::span<const uint8_t> b, size_t at) noexcept {
  return static_cast<int16_t>(ReadU16(b, at));
}

uint32_t ReadU32(std::span<const uint8_t> b, size_t at) noexcept {
  return static_cast<uint32_t>(b[at]) |
         (static_cast<uint32_t>(b[at + 1]) << 8) |
         (static_cast<uint32_t>(b[at + 2]) << 16) |
         (static_cast<uint32_t>(b[at + 3]) << 24);
}

int32_t ReadI32(std::span<const uint8_t> b, size_t at) noexcept {
  return static_cast<int32_t>(ReadU32(b, at));
}

float ReadF32(std::span<const uint8_t> b, size_t at) noexcept {
  const uint32_t bits = ReadU32(b, at);
  float value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

bool IsValidAttitude(float roll, float pitch, float yaw) noexcept {
  return std::fabs(roll) <= Limits::kMaxRollPitchDeg &&
         std::fabs(pitch) <= Limits::kMaxRollPitchDeg &&
         std::fabs(yaw) <= Limits::kMaxYawDeg;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// AHRS
// ═══════════════════════════════════════════════════════════════════════════

PayloadResult<AhrsSample> PayloadDecoder::DecodeAhrs(
    std::span<const uint8_t> payload, uint32_t now_ms) noexcept {
  if (payload.size() < AHRS_MIN_SIZE) {
    return PayloadError::TooShort;
  }

  AhrsSample s;
  s.roll = static_cast<float>(ReadI16(payload, 0)) / 100.0f;
  s.pitch = static_cast<float>(ReadI16(payload, 2)) / 100.0f;
  s.yaw = static_cast<float>(ReadU16(payload, 4)) / 100.0f;
  s.altitude = static_cast<float>(ReadI16(payload, 6)) / 10.0f;

  if (payload.size() >= AHRS_FULL_SIZE) {
    s.roll_sp = static_cast<float>(ReadI16(payload, 8)) / 100.0f;
    s.pitch_sp = static_cast<float>(ReadI16(payload, 10)) / 100.0f;
    s.yaw_sp = static_cast<float>(ReadU16(payload, 12)) / 100.0f;
    s.altitude_sp = static_cast<float>(ReadI16(payload, 14)) / 10.0f;
  } else {
    s.roll_sp = s.roll;
    s.pitch_sp = s.pitch;
    s.yaw_sp = s.yaw;
    s.altitude_sp = s.altitude;
  }
  s.timestamp = now_ms;

  if (!IsValidAttitude(s.roll, s.pitch, s.yaw)) {
    return PayloadError::OutOfRange;
  }
  return s;
}

// ═══════════════════════════════════════════════════════════════════════════
// GPS
// ═══════════════════════════════════════════════════════════════════════════

PayloadResult<GpsFix> PayloadDecoder::DecodeGps(
    std::span<const uint8_t> payload, uint32_t now_ms) noexcept {
  if (payload.size() < GPS_MIN_SIZE) {
    return PayloadError::TooShort;
  }

  GpsFix fix;
  fix.latitude = static_cast<double>(ReadI32(payload, 0)) / 1e7;
  fix.longitude = static_cast<double>(ReadI32(payload, 4)) / 1e7;
  fix.battery_voltage = static_cast<float>(ReadU16(payload, 8)) / 100.0f;
  fix.swa = payload[10];
  fix.swc = payload[11];
  fix.failsafe = payload[12];
  // Высота и число спутников бинарным кадром не передаются
  fix.altitude = 0.0f;
  fix.satellites = 0;
  fix.fix_quality = (fix.latitude != 0.0 && fix.longitude != 0.0) ? 1 : 0;
  fix.source = GpsSource::Binary;
  fix.timestamp = now_ms;

  if (std::fabs(fix.latitude) > Limits::kMaxLatitudeDeg ||
      std::fabs(fix.longitude) > Limits::kMaxLongitudeDeg) {
    return PayloadError::OutOfRange;
  }
  return fix;
}

// ═══════════════════════════════════════════════════════════════════════════
// PID
// ═══════════════════════════════════════════════════════════════════════════

bool PayloadDecoder::IsValidPidValue(float value) noexcept {
  return std::isfinite(value) && std::fabs(value) <= Limits::kMaxPidGain;
}

PayloadResult<PidGainRecord> PayloadDecoder::DecodePidGain(
    protocol::PidAxis axis, std::span<const uint8_t> payload,
    uint32_t now_ms) noexcept {
  if (payload.size() < PID_MIN_SIZE) {
    return PayloadError::TooShort;
  }

  PidGainRecord rec;
  rec.axis = axis;
  rec.p = ReadF32(payload, 0);
  rec.i = ReadF32(payload, 4);
  rec.d = ReadF32(payload, 8);
  rec.timestamp = now_ms;

  if (!IsValidPidValue(rec.p) || !IsValidPidValue(rec.i) ||
      !IsValidPidValue(rec.d)) {
    return PayloadError::OutOfRange;
  }
  return rec;
}

// ═══════════════════════════════════════════════════════════════════════════
// Батарея, ESC, режим
// ═══════════════════════════════════════════════════════════════════════════

PayloadResult<BatteryStatus> PayloadDecoder::DecodeBattery(
    std::span<const uint8_t> payload, uint32_t now_ms) noexcept {
  if (payload.size() < BATTERY_MIN_SIZE) {
    return PayloadError::TooShort;
  }

  BatteryStatus st;
  st.voltage = static_cast<float>(ReadU16(payload, 0)) / 100.0f;
  st.current = static_cast<float>(ReadI16(payload, 2)) / 100.0f;
  st.consumption_mah = ReadU32(payload, 4);
  st.cells = payload[8];
  st.remaining_capacity = ReadU16(payload, 9);
  st.timestamp = now_ms;
  return st;
}

PayloadResult<EscStatus> PayloadDecoder::DecodeEsc(
    std::span<const uint8_t> payload, uint32_t now_ms) noexcept {
  if (payload.size() < ESC_MIN_SIZE) {
    return PayloadError::TooShort;
  }

  EscStatus st;
  for (size_t m = 0; m < ESC_MOTOR_COUNT; m++) {
    const size_t at = m * 3;
    auto& motor = st.per_motor[m];
    motor.temperature = payload[at];
    motor.voltage = static_cast<float>(payload[at + 1]) / 10.0f;
    motor.current = static_cast<float>(payload[at + 2]) / 10.0f;
    motor.rpm = 0;
  }
  st.timestamp = now_ms;
  return st;
}

PayloadResult<FlightModeStatus> PayloadDecoder::DecodeFlightMode(
    std::span<const uint8_t> payload, uint32_t now_ms) noexcept {
  if (payload.size() < FLIGHT_MODE_MIN_SIZE) {
    return PayloadError::TooShort;
  }

  FlightModeStatus st;
  st.mode_id = payload[0];
  st.mode = st.mode_id <= static_cast<uint8_t>(FlightMode::Land)
                ? static_cast<FlightMode>(st.mode_id)
                : FlightMode::Unknown;

  const uint8_t arming = payload[1];
  st.armed = (arming & 0x01) != 0;
  st.arming_state = static_cast<ArmingState>((arming >> 1) & 0x03);
  st.timestamp = now_ms;
  return st;
}

// ═══════════════════════════════════════════════════════════════════════════
// Расширенный GPS
// ═══════════════════════════════════════════════════════════════════════════

PayloadResult<GpsEnhancedStatus> PayloadDecoder::DecodeGpsEnhanced(
    std::span<const uint8_t> payload, uint32_t now_ms) noexcept {
  if (payload.size() < GPS_ENHANCED_MIN_SIZE) {
    return PayloadError::TooShort;
  }

  GpsEnhancedStatus st;
  st.fix_type = payload[0];
  st.satellites_visible = payload[1];
  st.hdop = static_cast<float>(ReadU16(payload, 2)) / 100.0f;
  st.vdop = static_cast<float>(ReadU16(payload, 4)) / 100.0f;
  st.home_lat = static_cast<double>(ReadI32(payload, 6)) / 1e7;
  st.home_lon = static_cast<double>(ReadI32(payload, 10)) / 1e7;
  st.home_alt = static_cast<float>(ReadI16(payload, 14)) / 10.0f;
  st.timestamp = now_ms;
  return st;
}

}  // namespace gs_bridge
