#include "protocol.hpp"

#include <algorithm>
#include <cstring>

namespace gs_bridge::protocol {

namespace {

constexpr std::array<std::string_view, PID_AXIS_COUNT> kPidAxisNames = {
    "roll_inner", "roll_outer", "pitch_inner",
    "pitch_outer", "yaw_angle", "yaw_rate"};

void WriteF32(uint8_t* dst, float value) noexcept {
  // Протокол использует little-endian IEEE 754 (как x86/ARM хост)
  std::memcpy(dst, &value, sizeof(value));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Имена и строки
// ═══════════════════════════════════════════════════════════════════════════

std::string_view PidAxisName(PidAxis axis) noexcept {
  const auto idx = static_cast<size_t>(axis);
  if (idx >= kPidAxisNames.size()) {
    return "unknown";
  }
  return kPidAxisNames[idx];
}

std::optional<PidAxis> ParsePidAxis(std::string_view name) noexcept {
  for (size_t i = 0; i < kPidAxisNames.size(); i++) {
    if (kPidAxisNames[i] == name) {
      return static_cast<PidAxis>(i);
    }
  }
  return std::nullopt;
}

std::string_view ToString(FrameError err) noexcept {
  switch (err) {
    case FrameError::BadLength:
      return "bad length";
    case FrameError::BadSync:
      return "bad sync";
    case FrameError::BadChecksum:
      return "checksum mismatch";
  }
  return "unknown";
}

std::string_view ToString(PayloadError err) noexcept {
  switch (err) {
    case PayloadError::TooShort:
      return "payload too short";
    case PayloadError::OutOfRange:
      return "value out of range";
  }
  return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// Checksum
// ═══════════════════════════════════════════════════════════════════════════

uint8_t Checksum::Compute(std::span<const uint8_t> data) noexcept {
  uint8_t sum = 0;
  for (uint8_t b : data) {
    sum = static_cast<uint8_t>(sum + b);
  }
  return static_cast<uint8_t>(0xFF - sum);
}

bool Checksum::Validate(std::span<const uint8_t> frame) noexcept {
  if (frame.size() < FRAME_SIZE) {
    return false;
  }
  return Compute(frame.first(CHECKSUM_INDEX)) == frame[CHECKSUM_INDEX];
}

// ═══════════════════════════════════════════════════════════════════════════
// FrameBuilder - построение кадров
// ═══════════════════════════════════════════════════════════════════════════

Frame FrameBuilder::Build(uint8_t message_id,
                          std::span<const uint8_t> payload) const noexcept {
  Frame frame{};
  frame[0] = sync_.b0;
  frame[1] = sync_.b1;
  frame[2] = message_id;

  // Остаток payload уже заполнен нулями
  const size_t n = std::min(payload.size(), PAYLOAD_SIZE);
  if (n > 0) {
    std::memcpy(frame.data() + PAYLOAD_OFFSET, payload.data(), n);
  }

  frame[CHECKSUM_INDEX] =
      Checksum::Compute(std::span<const uint8_t>(frame).first(CHECKSUM_INDEX));
  return frame;
}

// ═══════════════════════════════════════════════════════════════════════════
// FrameParser - парсинг кадров
// ═══════════════════════════════════════════════════════════════════════════

Result<DecodedFrame> FrameParser::Parse(std::span<const uint8_t> buffer,
                                        SyncMarker expected_sync) noexcept {
  if (buffer.size() != FRAME_SIZE) {
    return FrameError::BadLength;
  }

  if (!expected_sync.Matches(buffer)) {
    return FrameError::BadSync;
  }

  if (!Checksum::Validate(buffer)) {
    return FrameError::BadChecksum;
  }

  DecodedFrame frame;
  frame.message_id = buffer[2];
  std::memcpy(frame.payload.data(), buffer.data() + PAYLOAD_OFFSET,
              PAYLOAD_SIZE);
  return frame;
}

int FrameParser::FindFrameStart(std::span<const uint8_t> buffer,
                                SyncMarker sync) noexcept {
  if (buffer.size() < FRAME_SIZE) {
    return -1;
  }

  for (size_t i = 0; i + FRAME_SIZE <= buffer.size(); i++) {
    if (buffer[i] == sync.b0 && buffer[i + 1] == sync.b1) {
      return static_cast<int>(i);
    }
  }

  return -1;
}

// ═══════════════════════════════════════════════════════════════════════════
// Protocol - команды GS → FC
// ═══════════════════════════════════════════════════════════════════════════

Frame Protocol::BuildPidGainSet(PidAxis axis, float p, float i,
                                float d) noexcept {
  Payload payload{};
  WriteF32(payload.data() + 0, p);
  WriteF32(payload.data() + 4, i);
  WriteF32(payload.data() + 8, d);

  FrameBuilder builder(SYNC_GS);
  return builder.Build(static_cast<uint8_t>(axis), payload);
}

Frame Protocol::BuildPidGainRequest(uint8_t axis_or_all) noexcept {
  Payload payload{};
  payload[0] = axis_or_all;

  FrameBuilder builder(SYNC_GS);
  return builder.Build(msg_id::PID_REQUEST, payload);
}

}  // namespace gs_bridge::protocol
