#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "link_config.hpp"
#include "link_platform.hpp"
#include "protocol.hpp"
#include "stream_demuxer.hpp"
#include "telemetry_types.hpp"

namespace gs_bridge {

/**
 * @brief Состояние канала
 */
enum class LinkState : uint8_t {
  Disconnected = 0,  ///< Порт закрыт
  Connecting,        ///< Открытие или переподключение
  Connected          ///< Порт открыт, поток читается
};

[[nodiscard]] const char* LinkStateName(LinkState state) noexcept;

/**
 * @brief Счётчики канала
 *
 * Каждый отброшенный кадр или предложение увеличивает ровно один счётчик.
 */
struct LinkStats {
  uint64_t bytes_received{0};
  uint32_t frames_decoded{0};    ///< Кадры FC с верной суммой
  uint32_t sync_errors{0};       ///< FrameError::BadSync
  uint32_t checksum_errors{0};   ///< FrameError::BadChecksum
  uint32_t length_errors{0};     ///< FrameError::BadLength
  uint32_t range_rejections{0};  ///< RecordRejected
  uint32_t unknown_messages{0};
  uint32_t nmea_sentences{0};    ///< Все принятые предложения
  uint32_t nmea_drops{0};        ///< Предложения без позиции из-за ошибки
  uint32_t overflow_resets{0};   ///< Сбросы буфера демультиплексора
  uint32_t reconnect_attempts{0};
  uint32_t frames_sent{0};
  uint32_t send_failures{0};
};

/** Режим терминала: текст как есть или шестнадцатеричная строка. */
enum class TerminalMode : uint8_t { Ascii = 0, Hex };

/**
 * @brief Сессия последовательного канала GS ↔ FC
 *
 * Владеет портом и демультиплексором. Принятые сообщения проходят
 * FrameParser / NmeaParser → MessageDispatcher и передаются в sink.
 *
 * Потоки:
 * - чтение: Poll() из собственного потока (Start) или из вызывающего;
 * - запись: Send*() из любого потока, сериализуется port_mutex_.
 *
 * Stop() и Disconnect() можно вызывать из sink: тогда разбор текущего
 * блока прекращается, поток чтения завершается сам, а присоединяется
 * следующим Start(), Connect() или деструктором. Connect() и Start()
 * из потока чтения отклоняются. Уничтожать сессию из sink нельзя.
 *
 * Переподключение: при ошибке чтения выполняется до
 * LinkConfig::max_reconnect_attempts попыток с паузой
 * reconnect_backoff_ms между ними. Каждая попытка пробует сначала
 * прежний порт, затем все найденные. Исчерпание попыток оставляет
 * сессию в Disconnected до явного Connect().
 *
 * @example
 * @code
 * PosixPlatform platform;
 * TelemetryStore store;
 * LinkSession session(platform, store, config);
 * if (IsOk(session.Connect("/dev/ttyUSB0", 115200))) {
 *   session.Start();
 *   session.SendPidGain(protocol::PidAxis::RollInner, 1.0f, 0.1f, 0.01f);
 * }
 * @endcode
 */
class LinkSession {
 public:
  LinkSession(LinkPlatform& platform, TelemetrySink& sink,
              LinkConfig config = {});
  ~LinkSession();

  LinkSession(const LinkSession&) = delete;
  LinkSession& operator=(const LinkSession&) = delete;

  /**
   * @brief Открыть порт
   * @param port Путь устройства
   * @param baud Скорость, бод
   * @return true или ошибка открытия (состояние остаётся Disconnected)
   */
  [[nodiscard]] IoResult<bool> Connect(const std::string& port, uint32_t baud);

  /**
   * @brief Открыть порт из конфигурации
   *
   * Пустой LinkConfig::port — первый порт из ListPorts().
   */
  [[nodiscard]] IoResult<bool> Connect();

  /**
   * @brief Одна итерация цикла чтения
   * @return false если канал не подключён
   */
  bool Poll();

  /**
   * @brief Запустить поток чтения
   * @return false если не подключён, поток уже запущен или вызов
   *         сделан из потока чтения
   */
  bool Start();

  /**
   * @brief Остановить поток чтения (порт остаётся открытым)
   */
  void Stop();

  /**
   * @brief Закрыть порт и остановить поток чтения
   */
  void Disconnect();

  // ─────────────────────────────────────────────────────────────────────────
  // Отправка (GS → FC)
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Отправить кадр GS
   * @param message_id Идентификатор
   * @param payload Полезная нагрузка (дополняется нулями / обрезается до 16)
   * @return true если кадр записан целиком
   */
  bool Send(uint8_t message_id, std::span<const uint8_t> payload);

  bool SendPidGain(protocol::PidAxis axis, float p, float i, float d);

  /**
   * @brief Запросить коэффициенты PID
   * @param axis Ось; std::nullopt — все оси
   */
  bool RequestPidGain(std::optional<protocol::PidAxis> axis);

  /**
   * @brief Записать в порт сырые байты без кадрирования
   * @param text ASCII-текст или шестнадцатеричная строка ("47 53 10")
   * @return false если не подключён, текст не ASCII или hex невалиден
   */
  bool SendTerminal(std::string_view text, TerminalMode mode);

  /**
   * @brief Разобрать шестнадцатеричную строку
   *
   * Пары шестнадцатеричных цифр; пробелы допускаются между байтами.
   */
  [[nodiscard]] static std::optional<std::vector<uint8_t>> ParseHex(
      std::string_view text);

  // ─────────────────────────────────────────────────────────────────────────
  // Состояние
  // ─────────────────────────────────────────────────────────────────────────

  [[nodiscard]] LinkState GetState() const noexcept { return state_.load(); }
  [[nodiscard]] bool IsConnected() const noexcept {
    return state_.load() == LinkState::Connected;
  }
  [[nodiscard]] LinkStats GetStats() const;
  [[nodiscard]] std::string GetPortName() const;
  [[nodiscard]] const LinkConfig& GetConfig() const noexcept { return config_; }

 private:
  void ReadLoop();
  bool IsReaderThread() const noexcept;
  bool Reconnect();
  void ClosePort();

  void HandleMessage(const DemuxResult& message);
  void HandleFrame(const protocol::Frame& bytes);
  void HandleNmea(const std::string& sentence);
  void Deliver(const TelemetryEvent& event);

  bool SendFrame(const protocol::Frame& frame);
  bool WriteBytes(std::span<const uint8_t> data, const char* what);

  void LogFormatted(LogLevel level, const char* fmt, ...) const;

  LinkPlatform& platform_;
  TelemetrySink& sink_;
  LinkConfig config_;

  StreamDemuxer demuxer_;  ///< Только поток чтения

  mutable std::mutex port_mutex_;
  std::shared_ptr<SerialPort> port_;
  std::string port_name_;
  uint32_t baud_{0};

  std::atomic<LinkState> state_{LinkState::Disconnected};
  std::atomic<bool> running_{false};
  std::atomic<bool> cancel_{false};
  std::thread reader_;

  mutable std::mutex stats_mutex_;
  LinkStats stats_;
};

}  // namespace gs_bridge
