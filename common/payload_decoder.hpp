#pragma once

#include <cstdint>
#include <span>

#include "protocol.hpp"
#include "telemetry_types.hpp"

namespace gs_bridge {

template <typename T>
using PayloadResult = protocol::Result<T, protocol::PayloadError>;

/**
 * Разбор payload входящих кадров (FC → GS) в типизированные записи.
 *
 * Все поля little-endian. Каждая функция проверяет минимальную длину payload
 * и диапазоны значений: запись с неправдоподобными значениями возвращается
 * как PayloadError::OutOfRange (повреждённые байты могут пройти проверку
 * суммы, но не пройти проверку диапазона).
 *
 * @param payload Данные кадра (обычно 16 байт)
 * @param now_ms Время приёма для поля timestamp
 */
class PayloadDecoder {
 public:
  /**
   * AHRS (0x10): roll:i16/100, pitch:i16/100, yaw:u16/100, alt:i16/10,
   * далее те же четыре поля для уставок. Если уставок нет (payload < 16),
   * уставки равны текущим значениям.
   * Отклоняет |roll| > 180, |pitch| > 180, |yaw| > 360.
   */
  [[nodiscard]] static PayloadResult<AhrsSample> DecodeAhrs(
      std::span<const uint8_t> payload, uint32_t now_ms) noexcept;

  /**
   * GPS (0x11): lat:i32/1e7, lon:i32/1e7, batt:u16/100, swa, swc, failsafe.
   * Отклоняет |lat| > 90, |lon| > 180.
   */
  [[nodiscard]] static PayloadResult<GpsFix> DecodeGps(
      std::span<const uint8_t> payload, uint32_t now_ms) noexcept;

  /**
   * PID (0x00–0x05): p, i, d как f32.
   * Отклоняет NaN/Inf и |value| > 1000.
   */
  [[nodiscard]] static PayloadResult<PidGainRecord> DecodePidGain(
      protocol::PidAxis axis, std::span<const uint8_t> payload,
      uint32_t now_ms) noexcept;

  /**
   * Батарея (0x12): voltage:u16/100, current:i16/100, consumption:u32,
   * cells:u8, remaining:u16.
   */
  [[nodiscard]] static PayloadResult<BatteryStatus> DecodeBattery(
      std::span<const uint8_t> payload, uint32_t now_ms) noexcept;

  /** ESC × 4 (0x13): {temp:u8, volt:u8/10, curr:u8/10} на мотор. */
  [[nodiscard]] static PayloadResult<EscStatus> DecodeEsc(
      std::span<const uint8_t> payload, uint32_t now_ms) noexcept;

  /** Полётный режим (0x14): mode_id:u8, arming:u8 (bit0, bits 1-2). */
  [[nodiscard]] static PayloadResult<FlightModeStatus> DecodeFlightMode(
      std::span<const uint8_t> payload, uint32_t now_ms) noexcept;

  /**
   * Расширенный GPS (0x15): fix, sats, hdop:u16/100, vdop:u16/100,
   * home_lat:i32/1e7, home_lon:i32/1e7, home_alt:i16/10.
   */
  [[nodiscard]] static PayloadResult<GpsEnhancedStatus> DecodeGpsEnhanced(
      std::span<const uint8_t> payload, uint32_t now_ms) noexcept;

  /** Допустимое значение коэффициента PID. */
  [[nodiscard]] static bool IsValidPidValue(float value) noexcept;
};

}  // namespace gs_bridge
