#include "stream_demuxer.hpp"

#include <algorithm>
#include <cstring>

namespace gs_bridge {

// ═══════════════════════════════════════════════════════════════════════════
// DecoderBuffer - реализация
// ═══════════════════════════════════════════════════════════════════════════

void DecoderBuffer::Consume(size_t n) noexcept {
  if (n == 0) return;
  if (n >= pos_) {
    pos_ = 0;
    return;
  }

  std::memmove(data_.data(), data_.data() + n, pos_ - n);
  pos_ -= n;
}

// ═══════════════════════════════════════════════════════════════════════════
// StreamDemuxer - реализация
// ═══════════════════════════════════════════════════════════════════════════

DemuxResult StreamDemuxer::Feed(uint8_t byte) {
  DemuxResult result = (state_ == DemuxState::AccumulatingNmea)
                           ? FeedNmea(byte)
                           : FeedBinary(byte);

  // Защита от бесконечного роста на мусоре
  if (buffer_.Size() > config::DemuxConfig::kMaxBufferSize) {
    ++overflow_count_;
    Reset();
  }
  return result;
}

DemuxResult StreamDemuxer::FeedBinary(uint8_t byte) {
  if (buffer_.Empty() && byte == config::DemuxConfig::kNmeaStart) {
    buffer_.Append(byte);
    state_ = DemuxState::AccumulatingNmea;
    return Incomplete{};
  }

  buffer_.Append(byte);
  state_ = DemuxState::AccumulatingBinary;

  if (buffer_.Size() < protocol::FRAME_SIZE) {
    return Incomplete{};
  }

  // Маркер ищется по всему окну, а не только в позиции 0: так
  // выравнивание восстанавливается после потерянного байта
  const auto data = buffer_.Data();
  const int start = protocol::FrameParser::FindFrameStart(data);
  if (start < 0) {
    buffer_.SkipOne();
    if (UpdateStateFromHead() == DemuxState::AccumulatingNmea) {
      // Окно могло уже вместить предложение целиком
      return TakeNmeaSentence();
    }
    return Incomplete{};
  }

  BinaryFrame frame;
  std::copy_n(data.begin() + start, protocol::FRAME_SIZE, frame.bytes.begin());
  buffer_.Consume(static_cast<size_t>(start) + protocol::FRAME_SIZE);
  UpdateStateFromHead();
  return frame;
}

DemuxResult StreamDemuxer::FeedNmea(uint8_t byte) {
  buffer_.Append(byte);
  if (byte != '\n') {
    return Incomplete{};
  }
  return TakeNmeaSentence();
}

DemuxResult StreamDemuxer::TakeNmeaSentence() {
  const auto data = buffer_.Data();
  for (size_t i = 1; i < data.size(); ++i) {
    if (data[i - 1] != '\r' || data[i] != '\n') continue;

    NmeaSentence sentence;
    sentence.text.assign(reinterpret_cast<const char*>(data.data()), i - 1);
    buffer_.Consume(i + 1);
    UpdateStateFromHead();
    return sentence;
  }
  return Incomplete{};
}

DemuxState StreamDemuxer::UpdateStateFromHead() noexcept {
  if (buffer_.Empty()) {
    state_ = DemuxState::Seeking;
  } else if (buffer_.Data()[0] == config::DemuxConfig::kNmeaStart) {
    state_ = DemuxState::AccumulatingNmea;
  } else {
    state_ = DemuxState::AccumulatingBinary;
  }
  return state_;
}

}  // namespace gs_bridge
