#pragma once

#include <cstdint>
#include <string>

#include "config.hpp"

namespace gs_bridge {

/**
 * @brief Конфигурация канала связи с полётным контроллером
 *
 * Заполняется из аргументов командной строки хоста.
 */
struct LinkConfig {
  /** Путь устройства; пустой — взять первый найденный порт */
  std::string port;

  /** Скорость порта, бод. По умолчанию 115200. */
  uint32_t baud{config::LinkDefaults::kBaudRate};

  /**
   * Число попыток переподключения после ошибки ввода-вывода.
   * Диапазон: 1–20, по умолчанию 5. После исчерпания канал остаётся
   * отключённым до явного Connect().
   */
  uint32_t max_reconnect_attempts{config::LinkDefaults::kMaxReconnectAttempts};

  /**
   * Пауза между попытками переподключения (мс).
   * Диапазон: 100–10000, по умолчанию 2000.
   */
  uint32_t reconnect_backoff_ms{config::LinkDefaults::kReconnectBackoffMs};

  /**
   * Максимальное ожидание одного чтения (мс).
   * Диапазон: 1–1000, по умолчанию 100. Определяет задержку реакции
   * потока чтения на Stop().
   */
  uint32_t read_timeout_ms{config::LinkDefaults::kReadTimeoutMs};

  /** Напряжение батареи, подставляемое в позиции из NMEA (В) */
  float nmea_battery_voltage{config::NmeaDefaults::kBatteryVoltage};

  /**
   * @brief Проверить валидность конфигурации
   * @return true если конфигурация валидна
   */
  [[nodiscard]] bool IsValid() const noexcept {
    return baud > 0 && max_reconnect_attempts >= 1 &&
           max_reconnect_attempts <= 20 && reconnect_backoff_ms >= 100 &&
           reconnect_backoff_ms <= 10000 && read_timeout_ms >= 1 &&
           read_timeout_ms <= 1000 && nmea_battery_voltage >= 0.0f;
  }

  /**
   * @brief Сбросить конфигурацию к значениям по умолчанию
   */
  void Reset() {
    port.clear();
    baud = config::LinkDefaults::kBaudRate;
    max_reconnect_attempts = config::LinkDefaults::kMaxReconnectAttempts;
    reconnect_backoff_ms = config::LinkDefaults::kReconnectBackoffMs;
    read_timeout_ms = config::LinkDefaults::kReadTimeoutMs;
    nmea_battery_voltage = config::NmeaDefaults::kBatteryVoltage;
  }

  /**
   * @brief Применить ограничения к параметрам
   */
  void Clamp() noexcept {
    if (baud == 0) baud = config::LinkDefaults::kBaudRate;
    if (max_reconnect_attempts < 1) max_reconnect_attempts = 1;
    if (max_reconnect_attempts > 20) max_reconnect_attempts = 20;
    if (reconnect_backoff_ms < 100) reconnect_backoff_ms = 100;
    if (reconnect_backoff_ms > 10000) reconnect_backoff_ms = 10000;
    if (read_timeout_ms < 1) read_timeout_ms = 1;
    if (read_timeout_ms > 1000) read_timeout_ms = 1000;
    if (nmea_battery_voltage < 0.0f) nmea_battery_voltage = 0.0f;
  }
};

}  // namespace gs_bridge
