#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <string_view>
#include <variant>

#include "config.hpp"
#include "protocol.hpp"

namespace gs_bridge {

// ═══════════════════════════════════════════════════════════════════════════
// Записи телеметрии (FC → GS)
// ═══════════════════════════════════════════════════════════════════════════

/**
 * AHRS (0x10): углы в градусах, высота в метрах.
 */
struct AhrsSample {
  float roll{0.0f};
  float pitch{0.0f};
  float yaw{0.0f};
  float altitude{0.0f};
  float roll_sp{0.0f};
  float pitch_sp{0.0f};
  float yaw_sp{0.0f};
  float altitude_sp{0.0f};
  uint32_t timestamp{0};  ///< Время приёма, мс
};

/** Источник GPS-координат. */
enum class GpsSource : uint8_t { Binary = 0, Nmea };

/**
 * Позиция GPS: бинарный кадр 0x11 или NMEA-предложение.
 */
struct GpsFix {
  double latitude{0.0};   ///< Градусы, + север
  double longitude{0.0};  ///< Градусы, + восток
  float altitude{0.0f};   ///< Метры (только GPGGA)
  float battery_voltage{0.0f};
  uint8_t swa{0};       ///< iBus SwA: 0 = Up, 1 = Down
  uint8_t swc{0};       ///< iBus SwC: 0 = Up, 1 = Mid, 2 = Down
  uint8_t failsafe{0};  ///< 0 = Normal, 1 = Triggered, 2 = нет iBus
  uint8_t fix_quality{0};
  uint8_t satellites{0};
  float hdop{0.0f};
  GpsSource source{GpsSource::Binary};
  uint32_t timestamp{0};

  [[nodiscard]] bool IsFailsafeTriggered() const noexcept {
    return failsafe == 1;
  }

  /** Заряд в процентах по напряжению (3.0 В → 0 %, 4.2 В → 100 %). */
  [[nodiscard]] float BatteryPercentage() const noexcept {
    using L = config::BatteryLimits;
    const float pct = (battery_voltage - L::kCellEmptyV) * 100.0f /
                      (L::kCellFullV - L::kCellEmptyV);
    return std::clamp(pct, 0.0f, 100.0f);
  }

  [[nodiscard]] bool IsLowBattery() const noexcept {
    return battery_voltage < config::BatteryLimits::kLowBatteryV;
  }
};

/**
 * Состояние батареи (0x12).
 */
struct BatteryStatus {
  float voltage{0.0f};  ///< В
  float current{0.0f};  ///< А (со знаком)
  uint32_t consumption_mah{0};
  uint8_t cells{0};
  uint16_t remaining_capacity{0};  ///< мА·ч
  uint32_t timestamp{0};

  [[nodiscard]] float VoltagePerCell() const noexcept {
    return cells > 0 ? voltage / static_cast<float>(cells) : 0.0f;
  }

  /** Оценка оставшегося времени полёта в минутах (0 при малом токе). */
  [[nodiscard]] float EstimatedFlightTimeMin() const noexcept {
    if (current <= config::BatteryLimits::kMinCurrentForEstimateA) {
      return 0.0f;
    }
    return static_cast<float>(remaining_capacity) / (current * 1000.0f) *
           60.0f;
  }
};

/**
 * Телеметрия одного ESC.
 */
struct EscMotor {
  uint8_t temperature{0};  ///< °C
  float voltage{0.0f};     ///< В
  float current{0.0f};     ///< А
  uint32_t rpm{0};         ///< Не передаётся протоколом, всегда 0
};

inline constexpr size_t ESC_MOTOR_COUNT = 4;

/**
 * Состояние ESC × 4 (0x13).
 */
struct EscStatus {
  std::array<EscMotor, ESC_MOTOR_COUNT> per_motor{};
  uint32_t timestamp{0};
};

/** Полётный режим (байт mode_id кадра 0x14). */
enum class FlightMode : uint8_t {
  Manual = 0,
  Stabilize,
  AltHold,
  Auto,
  Rtl,
  Land,
  Unknown = 0xFF
};

/** Состояние арминга (биты 1-2 байта arming кадра 0x14). */
enum class ArmingState : uint8_t {
  Standby = 0,
  Arming,
  Armed,
  Disarming
};

/**
 * Полётный режим и арминг (0x14).
 */
struct FlightModeStatus {
  uint8_t mode_id{0};
  FlightMode mode{FlightMode::Manual};
  bool armed{false};
  ArmingState arming_state{ArmingState::Standby};
  uint32_t timestamp{0};

  [[nodiscard]] std::string_view ModeName() const noexcept;
  [[nodiscard]] std::string_view ArmingStateName() const noexcept;
};

/**
 * Расширенный статус GPS (0x15).
 */
struct GpsEnhancedStatus {
  uint8_t fix_type{0};
  uint8_t satellites_visible{0};
  float hdop{0.0f};
  float vdop{0.0f};
  double home_lat{0.0};
  double home_lon{0.0};
  float home_alt{0.0f};
  uint32_t timestamp{0};

  [[nodiscard]] bool IsHomeSet() const noexcept {
    return home_lat != 0.0 && home_lon != 0.0;
  }
};

/**
 * Коэффициенты PID одной оси (0x00–0x05, подтверждение от FC).
 */
struct PidGainRecord {
  protocol::PidAxis axis{protocol::PidAxis::RollInner};
  float p{0.0f};
  float i{0.0f};
  float d{0.0f};
  uint32_t timestamp{0};
};

// ═══════════════════════════════════════════════════════════════════════════
// События телеметрии
// ═══════════════════════════════════════════════════════════════════════════

struct AhrsUpdated {
  AhrsSample sample;
};

struct GpsUpdated {
  GpsFix fix;
};

struct PidAckReceived {
  PidGainRecord gains;
};

struct BatteryUpdated {
  BatteryStatus status;
};

struct EscUpdated {
  EscStatus status;
};

struct FlightModeChanged {
  FlightModeStatus status;
};

struct GpsEnhancedUpdated {
  GpsEnhancedStatus status;
};

struct UnknownMessage {
  uint8_t message_id{0};
};

/** Кадр прошёл проверку суммы, но значения не прошли валидацию. */
struct RecordRejected {
  uint8_t message_id{0};
  protocol::PayloadError error{protocol::PayloadError::OutOfRange};
};

using TelemetryEvent =
    std::variant<AhrsUpdated, GpsUpdated, PidAckReceived, BatteryUpdated,
                 EscUpdated, FlightModeChanged, GpsEnhancedUpdated,
                 UnknownMessage, RecordRejected>;

/** Имя события для логов ("ahrs", "gps", ...). */
[[nodiscard]] std::string_view EventName(const TelemetryEvent& event) noexcept;

/**
 * Получатель событий телеметрии (состояние приложения, вывод, логгер).
 */
class TelemetrySink {
 public:
  virtual ~TelemetrySink() = default;

  /**
   * @brief Обработать событие
   * @note Вызывается из потока чтения канала
   */
  virtual void OnTelemetry(const TelemetryEvent& event) = 0;
};

}  // namespace gs_bridge
