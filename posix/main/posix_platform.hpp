#pragma once

#include <chrono>
#include <mutex>

#include "link_platform.hpp"

namespace gs_bridge {

/**
 * @brief Последовательный порт POSIX (termios, raw 8N1)
 *
 * Дескриптор открывается в PosixPlatform::OpenPort и закрывается в
 * Close() или деструкторе.
 */
class PosixSerialPort : public SerialPort {
 public:
  PosixSerialPort(int fd, std::string device);
  ~PosixSerialPort() override;

  PosixSerialPort(const PosixSerialPort&) = delete;
  PosixSerialPort& operator=(const PosixSerialPort&) = delete;

  [[nodiscard]] IoResult<size_t> Read(std::span<uint8_t> buf,
                                      uint32_t timeout_ms) override;
  [[nodiscard]] size_t BytesWaiting() override;
  [[nodiscard]] IoResult<size_t> Write(std::span<const uint8_t> data) override;
  void Close() override;
  [[nodiscard]] bool IsOpen() const override;

 private:
  mutable std::mutex mutex_;  ///< Защищает fd_ при Close() из другого потока
  int fd_{-1};
  std::string device_;
};

/**
 * @brief Реализация LinkPlatform для Linux / POSIX хоста
 *
 * - порты: termios, перечисление /dev/ttyUSB*, ttyACM*, ttyAMA*, ttyS*;
 * - время: std::chrono::steady_clock от момента создания;
 * - лог: stderr в формате ESP_LOG ("I (1234) gs_bridge: ...").
 */
class PosixPlatform : public LinkPlatform {
 public:
  PosixPlatform();
  ~PosixPlatform() override = default;

  [[nodiscard]] IoResult<std::shared_ptr<SerialPort>> OpenPort(
      const std::string& device, uint32_t baud) override;
  [[nodiscard]] std::vector<PortDescriptor> ListPorts() override;

  [[nodiscard]] uint32_t GetTimeMs() const noexcept override;
  void SleepMs(uint32_t ms) override;

  void Log(LogLevel level, std::string_view msg) const override;

 private:
  std::chrono::steady_clock::time_point start_;
  mutable std::mutex log_mutex_;
};

}  // namespace gs_bridge
