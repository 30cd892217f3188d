#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <variant>

#include "config.hpp"
#include "protocol.hpp"

namespace gs_bridge {

// ═══════════════════════════════════════════════════════════════════════════
// Результат демультиплексора
// ═══════════════════════════════════════════════════════════════════════════

/** Кандидат в бинарный кадр: 20 байт, начиная с маркера FC. */
struct BinaryFrame {
  protocol::Frame bytes{};
};

/** Полное NMEA-предложение: от '$' до "\r\n" (терминатор не включается). */
struct NmeaSentence {
  std::string text;
};

/** Сообщение ещё не собрано. */
struct Incomplete {};

using DemuxResult = std::variant<Incomplete, BinaryFrame, NmeaSentence>;

// ═══════════════════════════════════════════════════════════════════════════
// Буфер накопления
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Буфер накопления байт с ограниченной ёмкостью.
 */
class DecoderBuffer {
 public:
  static constexpr size_t CAPACITY = config::DemuxConfig::kMaxBufferSize + 1;

  /**
   * Добавить байт.
   * @return false если буфер полон (байт не добавлен)
   */
  bool Append(uint8_t byte) noexcept {
    if (pos_ >= CAPACITY) return false;
    data_[pos_++] = byte;
    return true;
  }

  /**
   * Получить span текущих данных.
   */
  [[nodiscard]] std::span<const uint8_t> Data() const noexcept {
    return std::span(data_.data(), pos_);
  }

  /**
   * Потребить n байт из начала буфера.
   * @param n Количество байт для удаления
   */
  void Consume(size_t n) noexcept;

  /**
   * Пропустить один байт (ресинхронизация по одному байту).
   */
  void SkipOne() noexcept { Consume(1); }

  void Reset() noexcept { pos_ = 0; }

  [[nodiscard]] size_t Size() const noexcept { return pos_; }
  [[nodiscard]] bool Empty() const noexcept { return pos_ == 0; }

 private:
  std::array<uint8_t, CAPACITY> data_{};
  size_t pos_{0};
};

// ═══════════════════════════════════════════════════════════════════════════
// Демультиплексор потока
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Состояние демультиплексора
 */
enum class DemuxState : uint8_t {
  Seeking = 0,         ///< Буфер пуст, формат не определён
  AccumulatingNmea,    ///< Первый байт '$', ждём "\r\n"
  AccumulatingBinary   ///< Скользящее окно поиска маркера FC
};

/**
 * @brief Разделение байтового потока на бинарные кадры и NMEA-предложения
 *
 * По каналу одновременно идут 20-байтовые кадры FC и ASCII NMEA от
 * отдельного GPS-модуля; байта мультиплексирования нет, формат
 * определяется по первому байту буфера.
 *
 * - Пустой буфер и '$' → накопление NMEA до "\r\n".
 * - Иначе байт добавляется в окно; при длине ≥ 20 ищется маркер FC, за
 *   которым помещается целый кадр. Найден — кадр выдаётся, байты до конца
 *   кадра удаляются. Не найден — удаляется самый старый байт.
 * - Если после сдвига окна в голове оказался '$', накопленные байты
 *   становятся началом NMEA-предложения.
 * - Более 100 байт без результата — буфер сбрасывается.
 *
 * Кадры выдаются как кандидаты: контрольная сумма проверяется в
 * FrameParser.
 *
 * @note Не потокобезопасен: принадлежит потоку чтения канала.
 */
class StreamDemuxer {
 public:
  StreamDemuxer() = default;

  /**
   * @brief Обработать один байт
   * @return BinaryFrame, NmeaSentence или Incomplete
   */
  [[nodiscard]] DemuxResult Feed(uint8_t byte);

  /**
   * @brief Обработать блок байт
   * @param bytes Принятые данные
   * @param on_message Вызывается для каждого BinaryFrame / NmeaSentence
   *        (аргумент — DemuxResult)
   * @return Количество выданных сообщений
   */
  template <typename Handler>
  size_t Feed(std::span<const uint8_t> bytes, Handler&& on_message) {
    size_t emitted = 0;
    for (uint8_t b : bytes) {
      DemuxResult r = Feed(b);
      if (!std::holds_alternative<Incomplete>(r)) {
        on_message(r);
        ++emitted;
      }
    }
    return emitted;
  }

  /**
   * @brief Сбросить буфер (после переподключения)
   */
  void Reset() noexcept {
    buffer_.Reset();
    state_ = DemuxState::Seeking;
  }

  [[nodiscard]] DemuxState GetState() const noexcept { return state_; }
  [[nodiscard]] size_t BufferedBytes() const noexcept { return buffer_.Size(); }

  /** Сколько раз буфер сбрасывался по переполнению. */
  [[nodiscard]] uint32_t OverflowCount() const noexcept {
    return overflow_count_;
  }

 private:
  DemuxResult FeedBinary(uint8_t byte);
  DemuxResult FeedNmea(uint8_t byte);

  /** Выдать предложение до первого "\r\n" в буфере, если оно есть. */
  DemuxResult TakeNmeaSentence();

  /** Состояние по первому байту буфера. */
  DemuxState UpdateStateFromHead() noexcept;

  DecoderBuffer buffer_;
  DemuxState state_{DemuxState::Seeking};
  uint32_t overflow_count_{0};
};

}  // namespace gs_bridge
