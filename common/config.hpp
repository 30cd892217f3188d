#pragma once

#include <cstddef>
#include <cstdint>

namespace gs_bridge::config {

/**
 * @brief Параметры кадра протокола FC ↔ GS
 */
struct FrameConfig {
  static constexpr size_t kFrameSize = 20;    ///< sync(2) + id(1) + payload(16) + chk(1)
  static constexpr size_t kSyncSize = 2;
  static constexpr size_t kPayloadSize = 16;
  static constexpr size_t kPayloadOffset = 3;
  static constexpr size_t kChecksumIndex = 19;
};

/**
 * @brief Конфигурация демультиплексора потока
 */
struct DemuxConfig {
  static constexpr size_t kMaxBufferSize =
      100;  ///< Сброс буфера при превышении
  static constexpr uint8_t kNmeaStart = '$';
};

/**
 * @brief Конфигурация последовательного канала
 */
struct LinkDefaults {
  static constexpr uint32_t kBaudRate = 115200;
  static constexpr uint32_t kMaxReconnectAttempts = 5;
  static constexpr uint32_t kReconnectBackoffMs =
      2000;  ///< Пауза между попытками переподключения
  static constexpr uint32_t kReadTimeoutMs =
      100;  ///< Ограничение ожидания одного чтения
  static constexpr size_t kMaxReadSize = 256;  ///< Предел одного чтения, байт
};

/**
 * @brief Значения по умолчанию для NMEA
 */
struct NmeaDefaults {
  /// NMEA не передаёт напряжение батареи — подставляется фиксированное
  static constexpr float kBatteryVoltage = 11.5f;
};

/**
 * @brief Пороги валидации телеметрии
 */
struct ValidationLimits {
  static constexpr float kMaxRollPitchDeg = 180.0f;
  static constexpr float kMaxYawDeg = 360.0f;
  static constexpr double kMaxLatitudeDeg = 90.0;
  static constexpr double kMaxLongitudeDeg = 180.0;
  static constexpr float kMaxPidGain = 1000.0f;
};

/**
 * @brief Параметры батареи для производных величин
 */
struct BatteryLimits {
  static constexpr float kCellEmptyV = 3.0f;
  static constexpr float kCellFullV = 4.2f;
  static constexpr float kLowBatteryV = 3.5f;
  static constexpr float kMinCurrentForEstimateA = 0.1f;
};

/**
 * @brief Навигационные оценки хранилища телеметрии
 */
struct NavigationConfig {
  static constexpr double kMetersPerDegree = 111000.0;  ///< Грубо, без учёта широты
};

}  // namespace gs_bridge::config
