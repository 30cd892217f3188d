#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <variant>

#include "config.hpp"

namespace gs_bridge::protocol {

// ═══════════════════════════════════════════════════════════════════════════
// Константы протокола
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr size_t FRAME_SIZE = config::FrameConfig::kFrameSize;
inline constexpr size_t PAYLOAD_SIZE = config::FrameConfig::kPayloadSize;
inline constexpr size_t PAYLOAD_OFFSET = config::FrameConfig::kPayloadOffset;
inline constexpr size_t CHECKSUM_INDEX = config::FrameConfig::kChecksumIndex;

using Frame = std::array<uint8_t, FRAME_SIZE>;
using Payload = std::array<uint8_t, PAYLOAD_SIZE>;

/**
 * Маркер синхронизации — определяет направление кадра.
 */
struct SyncMarker {
  uint8_t b0;
  uint8_t b1;

  [[nodiscard]] bool Matches(std::span<const uint8_t> bytes) const noexcept {
    return bytes.size() >= 2 && bytes[0] == b0 && bytes[1] == b1;
  }

  friend bool operator==(const SyncMarker&, const SyncMarker&) = default;
};

/** FC → GS ('F', 'C') */
inline constexpr SyncMarker SYNC_FC{0x46, 0x43};
/** GS → FC ('G', 'S') */
inline constexpr SyncMarker SYNC_GS{0x47, 0x53};

// ═══════════════════════════════════════════════════════════════════════════
// Идентификаторы сообщений
// ═══════════════════════════════════════════════════════════════════════════

namespace msg_id {
inline constexpr uint8_t PID_FIRST = 0x00;
inline constexpr uint8_t PID_LAST = 0x05;
inline constexpr uint8_t AHRS = 0x10;  // FC → GS
inline constexpr uint8_t PID_REQUEST = 0x10;  // GS → FC
inline constexpr uint8_t GPS = 0x11;
inline constexpr uint8_t BATTERY = 0x12;
inline constexpr uint8_t ESC = 0x13;
inline constexpr uint8_t FLIGHT_MODE = 0x14;
inline constexpr uint8_t GPS_ENHANCED = 0x15;
}  // namespace msg_id

/** Значение запроса PID, означающее «все оси». */
inline constexpr uint8_t PID_REQUEST_ALL = 0x06;

/**
 * Ось PID-регулятора. Значение совпадает с message_id кадра PID.
 */
enum class PidAxis : uint8_t {
  RollInner = 0x00,
  RollOuter = 0x01,
  PitchInner = 0x02,
  PitchOuter = 0x03,
  YawAngle = 0x04,
  YawRate = 0x05
};

inline constexpr size_t PID_AXIS_COUNT = 6;

[[nodiscard]] inline bool IsPidMessage(uint8_t id) noexcept {
  return id <= msg_id::PID_LAST;
}

/** Имя оси ("roll_inner", ...). */
[[nodiscard]] std::string_view PidAxisName(PidAxis axis) noexcept;

/** Разбор имени оси; std::nullopt для неизвестного имени. */
[[nodiscard]] std::optional<PidAxis> ParsePidAxis(
    std::string_view name) noexcept;

// ═══════════════════════════════════════════════════════════════════════════
// Ошибки
// ═══════════════════════════════════════════════════════════════════════════

enum class FrameError : uint8_t { BadLength, BadSync, BadChecksum };

enum class PayloadError : uint8_t { TooShort, OutOfRange };

[[nodiscard]] std::string_view ToString(FrameError err) noexcept;
[[nodiscard]] std::string_view ToString(PayloadError err) noexcept;

// ═══════════════════════════════════════════════════════════════════════════
// Result type (альтернатива std::expected для C++23)
// ═══════════════════════════════════════════════════════════════════════════

template <typename T, typename E = FrameError>
using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] inline bool IsOk(const std::variant<T, E>& r) noexcept {
  return std::holds_alternative<T>(r);
}

template <typename T, typename E>
[[nodiscard]] inline bool IsError(const std::variant<T, E>& r) noexcept {
  return std::holds_alternative<E>(r);
}

template <typename T, typename E>
[[nodiscard]] inline const T& GetValue(const std::variant<T, E>& r) noexcept {
  return *std::get_if<T>(&r);
}

template <typename T, typename E>
[[nodiscard]] inline E GetError(const std::variant<T, E>& r) noexcept {
  return *std::get_if<E>(&r);
}

// ═══════════════════════════════════════════════════════════════════════════
// Структуры данных
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Проверенный кадр: идентификатор и 16 байт payload.
 */
struct DecodedFrame {
  uint8_t message_id{0};
  Payload payload{};
};

// ═══════════════════════════════════════════════════════════════════════════
// Контрольная сумма
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Однобайтовая контрольная сумма: (0xFF - Σ bytes) & 0xFF.
 * Сумма считается по модулю 256, переполнение — штатное поведение.
 */
class Checksum {
 public:
  /**
   * Вычислить контрольную сумму.
   * @param data Байты кадра без контрольной суммы (обычно 0..18)
   * @return Контрольная сумма
   */
  [[nodiscard]] static uint8_t Compute(std::span<const uint8_t> data) noexcept;

  /**
   * Проверить контрольную сумму кадра (байт 19 против байтов 0..18).
   * @param frame Полный кадр
   * @return true если сумма совпадает; false для кадра короче 20 байт
   */
  [[nodiscard]] static bool Validate(std::span<const uint8_t> frame) noexcept;
};

// ═══════════════════════════════════════════════════════════════════════════
// Сборка и разбор кадров
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Построитель кадров протокола.
 * Payload дополняется нулями или обрезается до 16 байт — раскладка payload
 * фиксирована для каждого типа сообщения, поэтому обрезка не скрывает
 * ошибку формата.
 */
class FrameBuilder {
 public:
  explicit FrameBuilder(SyncMarker sync = SYNC_GS) noexcept : sync_(sync) {}

  /**
   * Построить кадр.
   * @param message_id Идентификатор сообщения
   * @param payload Данные (до 16 байт)
   * @return Готовый 20-байтовый кадр
   */
  [[nodiscard]] Frame Build(uint8_t message_id,
                            std::span<const uint8_t> payload) const noexcept;

 private:
  SyncMarker sync_;
};

/**
 * Парсер кадров протокола.
 */
class FrameParser {
 public:
  /**
   * Проверить и разобрать кадр.
   * @param buffer Ровно 20 байт
   * @param expected_sync Ожидаемый маркер (FC для входящих кадров)
   * @return Разобранный кадр или ошибка формата
   */
  [[nodiscard]] static Result<DecodedFrame> Parse(
      std::span<const uint8_t> buffer,
      SyncMarker expected_sync = SYNC_FC) noexcept;

  /**
   * Найти маркер синхронизации, за которым помещается целый кадр.
   * @param buffer Буфер для поиска
   * @param sync Маркер
   * @return Индекс начала кадра или -1 если не найден
   */
  [[nodiscard]] static int FindFrameStart(std::span<const uint8_t> buffer,
                                          SyncMarker sync = SYNC_FC) noexcept;
};

// ═══════════════════════════════════════════════════════════════════════════
// Команды GS → FC
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Сериализация исходящих команд.
 */
class Protocol {
 public:
  /**
   * Кадр установки коэффициентов PID (id = ось, payload = p, i, d как f32 LE).
   */
  [[nodiscard]] static Frame BuildPidGainSet(PidAxis axis, float p, float i,
                                             float d) noexcept;

  /**
   * Кадр запроса коэффициентов PID.
   * @param axis_or_all Номер оси 0..5 или PID_REQUEST_ALL
   */
  [[nodiscard]] static Frame BuildPidGainRequest(uint8_t axis_or_all) noexcept;

  /**
   * Произвольный кадр GS → FC.
   */
  [[nodiscard]] static Frame BuildRaw(
      uint8_t message_id, std::span<const uint8_t> payload) noexcept {
    return FrameBuilder(SYNC_GS).Build(message_id, payload);
  }
};

}  // namespace gs_bridge::protocol
