#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gs_bridge {

/**
 * @brief Уровни логирования
 */
enum class LogLevel : uint8_t { Info = 0, Warning, Error };

/**
 * @brief Ошибка ввода-вывода последовательного порта
 */
struct IoError {
  int code{0};          ///< errno или код платформы
  std::string message;  ///< Описание для логов
};

template <typename T>
using IoResult = std::variant<T, IoError>;

/**
 * @brief Описание найденного последовательного порта
 */
struct PortDescriptor {
  std::string device;       ///< Путь устройства ("/dev/ttyUSB0")
  std::string description;  ///< Драйвер / описание, если известно
};

/**
 * @brief Открытый последовательный порт
 *
 * Владение дескриптором: порт закрывается в деструкторе реализации.
 * Read и Write могут вызываться из разных потоков одновременно;
 * конкурентные Write сериализует вызывающий (LinkSession).
 */
class SerialPort {
 public:
  virtual ~SerialPort() = default;

  /**
   * @brief Прочитать доступные байты с ограниченным ожиданием
   * @param buf Буфер для чтения
   * @param timeout_ms Максимальное ожидание данных
   * @return Число прочитанных байт (0 — таймаут) или ошибка
   */
  [[nodiscard]] virtual IoResult<size_t> Read(std::span<uint8_t> buf,
                                              uint32_t timeout_ms) = 0;

  /**
   * @brief Количество байт, ожидающих чтения
   */
  [[nodiscard]] virtual size_t BytesWaiting() = 0;

  /**
   * @brief Записать данные целиком
   * @return Число записанных байт или ошибка
   */
  [[nodiscard]] virtual IoResult<size_t> Write(
      std::span<const uint8_t> data) = 0;

  virtual void Close() = 0;

  [[nodiscard]] virtual bool IsOpen() const = 0;
};

/**
 * @brief Абстрактный интерфейс платформы для LinkSession
 *
 * Предоставляет доступ к последовательным портам и платформенным сервисам
 * (логирование, время, задержки).
 *
 * Реализация предоставляется целевой платформой (POSIX хост, тестовый
 * двойник).
 *
 * @note Все методы должны быть потокобезопасными.
 */
class LinkPlatform {
 public:
  virtual ~LinkPlatform() = default;

  // ─────────────────────────────────────────────────────────────────────────
  // Последовательные порты
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Открыть порт
   * @param device Путь устройства
   * @param baud Скорость, бод
   * @return Открытый порт или ошибка ввода-вывода
   */
  [[nodiscard]] virtual IoResult<std::shared_ptr<SerialPort>> OpenPort(
      const std::string& device, uint32_t baud) = 0;

  /**
   * @brief Перечислить доступные порты
   */
  [[nodiscard]] virtual std::vector<PortDescriptor> ListPorts() = 0;

  // ─────────────────────────────────────────────────────────────────────────
  // Время
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Текущее время в миллисекундах
   * @return Монотонное время с момента старта
   */
  [[nodiscard]] virtual uint32_t GetTimeMs() const noexcept = 0;

  /**
   * @brief Приостановить текущий поток
   */
  virtual void SleepMs(uint32_t ms) = 0;

  // ─────────────────────────────────────────────────────────────────────────
  // Логирование
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Вывод лог-сообщения
   * @param level Уровень важности
   * @param msg Текст сообщения (UTF-8)
   */
  virtual void Log(LogLevel level, std::string_view msg) const = 0;
};

}  // namespace gs_bridge
