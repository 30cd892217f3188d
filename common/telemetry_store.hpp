#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>

#include "protocol.hpp"
#include "telemetry_types.hpp"

namespace gs_bridge {

/**
 * @brief Последние значения телеметрии
 *
 * Поле отсутствует (std::nullopt), пока соответствующее сообщение не
 * пришло ни разу.
 */
struct TelemetrySnapshot {
  std::optional<AhrsSample> ahrs;
  std::optional<GpsFix> gps;
  std::optional<BatteryStatus> battery;
  std::optional<EscStatus> esc;
  std::optional<FlightModeStatus> flight_mode;
  std::optional<GpsEnhancedStatus> gps_enhanced;
  std::array<std::optional<PidGainRecord>, protocol::PID_AXIS_COUNT> pid_gains{};

  float ahrs_rate_hz{0.0f};  ///< По интервалу между двумя последними AHRS
  uint32_t ahrs_count{0};
  uint32_t unknown_messages{0};

  /**
   * Расстояние до точки дома (м), грубая оценка по плоской Земле.
   * std::nullopt пока неизвестны текущая позиция или дом.
   */
  std::optional<float> distance_to_home_m;
};

/**
 * @brief Хранилище состояния телеметрии
 *
 * Один писатель (поток чтения канала через OnTelemetry), много читателей
 * (Snapshot). Все обращения под мьютексом.
 */
class TelemetryStore : public TelemetrySink {
 public:
  void OnTelemetry(const TelemetryEvent& event) override;

  /**
   * @brief Копия текущего состояния
   */
  [[nodiscard]] TelemetrySnapshot Snapshot() const;

  /**
   * @brief Коэффициенты PID одной оси
   */
  [[nodiscard]] std::optional<PidGainRecord> GetPidGains(
      protocol::PidAxis axis) const;

  /**
   * @brief Забыть всё (после смены порта)
   */
  void Clear();

 private:
  void UpdateDistanceToHome();

  mutable std::mutex mutex_;
  TelemetrySnapshot state_;
};

}  // namespace gs_bridge
