#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "config.hpp"
#include "telemetry_types.hpp"

namespace gs_bridge {

/**
 * Тип NMEA-предложения по 5-символьному коду после '$'.
 */
enum class NmeaSentenceType : uint8_t {
  Gga,          ///< GPGGA — позиция, высота, спутники
  Rmc,          ///< GPRMC — позиция, статус
  Gsv,          ///< GPGSV — только спутники в зоне видимости
  Unsupported,  ///< Корректный формат, неизвестный код
  Invalid       ///< Нет '$', '*' или слишком короткое
};

/**
 * Разбор ASCII NMEA-предложений GPS (GPGGA, GPRMC, GPGSV).
 *
 * Контрольная сумма "*CS" не проверяется: модуль GPS подключён к тому же
 * каналу, ошибки отбрасываются на уровне полей.
 *
 * @example
 * @code
 * auto fix = NmeaParser::Parse(
 *     "$GPGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,,,,*47");
 * // fix->latitude ≈ 48.1173, fix->longitude ≈ 11.5167
 * @endcode
 */
class NmeaParser {
 public:
  /**
   * Определить тип предложения.
   * @param sentence Текст (пробелы и CR/LF по краям игнорируются)
   */
  [[nodiscard]] static NmeaSentenceType Classify(
      std::string_view sentence) noexcept;

  /**
   * Разобрать предложение в позицию GPS.
   * @param sentence Текст предложения, начиная с '$'
   * @param default_battery_voltage Напряжение батареи — в NMEA его нет
   * @param now_ms Время приёма
   * @return Позиция или std::nullopt (GPGSV, неподдерживаемый тип, ошибка)
   */
  [[nodiscard]] static std::optional<GpsFix> Parse(
      std::string_view sentence,
      float default_battery_voltage = config::NmeaDefaults::kBatteryVoltage,
      uint32_t now_ms = 0) noexcept;

  /**
   * Перевести координату NMEA в градусы.
   * @param value "DDMM.MMMM" (deg_digits = 2) или "DDDMM.MMMM" (3)
   * @param hemisphere 'N'/'S'/'E'/'W'; для 'S' и 'W' результат отрицательный
   * @return Градусы; 0.0 для пустого поля или "0"; std::nullopt при ошибке
   */
  [[nodiscard]] static std::optional<double> ParseCoordinate(
      std::string_view value, std::string_view hemisphere,
      size_t deg_digits) noexcept;
};

}  // namespace gs_bridge
