#include "link_session.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdarg>
#include <cstdio>

#include "message_dispatcher.hpp"
#include "nmea_parser.hpp"
#include "payload_decoder.hpp"

namespace gs_bridge {

using protocol::GetError;
using protocol::GetValue;
using protocol::IsError;

namespace {

int HexDigit(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool IsSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Длина NMEA-предложения в логах (стандартный максимум — 82 символа)
constexpr int kLogSentenceMax = 82;

}  // namespace

const char* LinkStateName(LinkState state) noexcept {
  switch (state) {
    case LinkState::Disconnected:
      return "Disconnected";
    case LinkState::Connecting:
      return "Connecting";
    case LinkState::Connected:
      return "Connected";
  }
  return "Unknown";
}

LinkSession::LinkSession(LinkPlatform& platform, TelemetrySink& sink,
                         LinkConfig config)
    : platform_(platform), sink_(sink), config_(std::move(config)) {
  config_.Clamp();
}

LinkSession::~LinkSession() { Disconnect(); }

// ═══════════════════════════════════════════════════════════════════════════
// Подключение
// ═══════════════════════════════════════════════════════════════════════════

IoResult<bool> LinkSession::Connect(const std::string& port, uint32_t baud) {
  if (IsReaderThread()) {
    LogFormatted(LogLevel::Error, "Connect from reader thread refused");
    return IoError{EDEADLK, "connect from reader thread"};
  }
  if (state_.load() != LinkState::Disconnected || reader_.joinable()) {
    Disconnect();
  }

  cancel_.store(false);
  state_.store(LinkState::Connecting);
  LogFormatted(LogLevel::Info, "Connecting to %s at %u baud", port.c_str(),
               static_cast<unsigned>(baud));

  auto result = platform_.OpenPort(port, baud);
  if (IsError(result)) {
    const IoError err = GetError(result);
    state_.store(LinkState::Disconnected);
    LogFormatted(LogLevel::Error, "Failed to open %s: %s (%d)", port.c_str(),
                 err.message.c_str(), err.code);
    return err;
  }

  {
    std::lock_guard<std::mutex> lock(port_mutex_);
    port_ = GetValue(result);
    port_name_ = port;
    baud_ = baud;
  }
  demuxer_.Reset();
  state_.store(LinkState::Connected);
  LogFormatted(LogLevel::Info, "Connected to %s", port.c_str());
  return true;
}

IoResult<bool> LinkSession::Connect() {
  if (!config_.port.empty()) {
    return Connect(config_.port, config_.baud);
  }

  const auto ports = platform_.ListPorts();
  if (ports.empty()) {
    LogFormatted(LogLevel::Error, "No serial ports available");
    return IoError{ENODEV, "no serial ports available"};
  }
  return Connect(ports.front().device, config_.baud);
}

void LinkSession::ClosePort() {
  std::lock_guard<std::mutex> lock(port_mutex_);
  if (port_) {
    port_->Close();
    port_.reset();
  }
}

bool LinkSession::Reconnect() {
  state_.store(LinkState::Connecting);

  std::string previous;
  uint32_t baud = 0;
  {
    std::lock_guard<std::mutex> lock(port_mutex_);
    if (port_) {
      port_->Close();
      port_.reset();
    }
    previous = port_name_;
    baud = baud_;
  }
  demuxer_.Reset();

  LogFormatted(LogLevel::Info, "Attempting to reconnect (last port %s)",
               previous.c_str());

  const uint32_t max_attempts = config_.max_reconnect_attempts;
  for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    if (cancel_.load()) break;

    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.reconnect_attempts;
    }

    // Прежний порт первым: после сброса USB-адаптер обычно получает то же имя
    std::vector<std::string> candidates;
    if (!previous.empty()) candidates.push_back(previous);
    for (const auto& desc : platform_.ListPorts()) {
      if (desc.device != previous) candidates.push_back(desc.device);
    }

    if (candidates.empty()) {
      LogFormatted(LogLevel::Warning, "No serial ports available (attempt %u/%u)",
                   static_cast<unsigned>(attempt),
                   static_cast<unsigned>(max_attempts));
    }

    for (const auto& device : candidates) {
      if (cancel_.load()) break;

      auto result = platform_.OpenPort(device, baud);
      if (IsError(result)) {
        const IoError err = GetError(result);
        LogFormatted(LogLevel::Warning, "Failed to open %s: %s (%d)",
                     device.c_str(), err.message.c_str(), err.code);
        continue;
      }

      {
        std::lock_guard<std::mutex> lock(port_mutex_);
        port_ = GetValue(result);
        port_name_ = device;
      }
      state_.store(LinkState::Connected);
      LogFormatted(LogLevel::Info, "Reconnected to %s (attempt %u/%u)",
                   device.c_str(), static_cast<unsigned>(attempt),
                   static_cast<unsigned>(max_attempts));
      return true;
    }

    if (attempt < max_attempts && !cancel_.load()) {
      platform_.SleepMs(config_.reconnect_backoff_ms);
    }
  }

  state_.store(LinkState::Disconnected);
  if (!cancel_.load()) {
    LogFormatted(LogLevel::Error,
                 "Max reconnection attempts reached (%u), link closed",
                 static_cast<unsigned>(max_attempts));
  }
  return false;
}

void LinkSession::Disconnect() {
  cancel_.store(true);
  Stop();
  ClosePort();

  if (state_.exchange(LinkState::Disconnected) != LinkState::Disconnected) {
    LogFormatted(LogLevel::Info, "Disconnected from %s",
                 GetPortName().c_str());
  }
}

// ═══════════════════════════════════════════════════════════════════════════
// Цикл чтения
// ═══════════════════════════════════════════════════════════════════════════

bool LinkSession::Start() {
  if (IsReaderThread() || !IsConnected() || running_.load()) {
    return false;
  }
  if (reader_.joinable()) {
    reader_.join();
  }

  running_.store(true);
  reader_ = std::thread(&LinkSession::ReadLoop, this);
  return true;
}

void LinkSession::Stop() {
  running_.store(false);
  // Из sink в потоке чтения: ReadLoop выйдет сам, join выполнит
  // следующий Start(), Connect() или деструктор
  if (reader_.joinable() && !IsReaderThread()) {
    reader_.join();
  }
}

bool LinkSession::IsReaderThread() const noexcept {
  return reader_.get_id() == std::this_thread::get_id();
}

void LinkSession::ReadLoop() {
  while (running_.load() && Poll()) {
  }
  running_.store(false);
}

bool LinkSession::Poll() {
  if (state_.load() != LinkState::Connected) {
    return false;
  }

  std::shared_ptr<SerialPort> port;
  std::string name;
  {
    std::lock_guard<std::mutex> lock(port_mutex_);
    port = port_;
    name = port_name_;
  }
  if (!port) {
    return false;
  }

  // Сколько накопил драйвер, но не меньше байта: пустой порт ждёт таймаут
  std::array<uint8_t, config::LinkDefaults::kMaxReadSize> chunk{};
  const size_t want =
      std::clamp<size_t>(port->BytesWaiting(), 1, chunk.size());
  auto result = port->Read(std::span<uint8_t>(chunk.data(), want),
                           config_.read_timeout_ms);
  if (IsError(result)) {
    const IoError err = GetError(result);
    LogFormatted(LogLevel::Error, "Read error on %s: %s (%d)", name.c_str(),
                 err.message.c_str(), err.code);
    return Reconnect();
  }

  const size_t n = GetValue(result);
  if (n == 0) {
    return true;
  }

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.bytes_received += n;
  }

  // Stop() или Disconnect() из sink останавливает разбор остатка блока
  const bool threaded = IsReaderThread();
  const uint32_t overflows_before = demuxer_.OverflowCount();
  for (size_t k = 0; k < n && state_.load() == LinkState::Connected &&
                     (!threaded || running_.load());
       ++k) {
    const DemuxResult message = demuxer_.Feed(chunk[k]);
    if (!std::holds_alternative<Incomplete>(message)) {
      HandleMessage(message);
    }
  }

  const uint32_t overflows = demuxer_.OverflowCount() - overflows_before;
  if (overflows > 0) {
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      stats_.overflow_resets += overflows;
    }
    LogFormatted(LogLevel::Warning,
                 "Receive buffer overflow, %u reset(s), resyncing",
                 static_cast<unsigned>(overflows));
  }

  return state_.load() == LinkState::Connected;
}

void LinkSession::HandleMessage(const DemuxResult& message) {
  if (const auto* frame = std::get_if<BinaryFrame>(&message)) {
    HandleFrame(frame->bytes);
  } else if (const auto* sentence = std::get_if<NmeaSentence>(&message)) {
    HandleNmea(sentence->text);
  }
}

void LinkSession::HandleFrame(const protocol::Frame& bytes) {
  auto parsed = protocol::FrameParser::Parse(bytes);
  if (IsError(parsed)) {
    const protocol::FrameError err = GetError(parsed);
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      switch (err) {
        case protocol::FrameError::BadLength:
          ++stats_.length_errors;
          break;
        case protocol::FrameError::BadSync:
          ++stats_.sync_errors;
          break;
        case protocol::FrameError::BadChecksum:
          ++stats_.checksum_errors;
          break;
      }
    }
    const std::string_view reason = protocol::ToString(err);
    LogFormatted(LogLevel::Warning, "Frame dropped (id=0x%02X): %.*s",
                 bytes[2], static_cast<int>(reason.size()), reason.data());
    return;
  }

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.frames_decoded;
  }
  Deliver(MessageDispatcher::Dispatch(GetValue(parsed), platform_.GetTimeMs()));
}

void LinkSession::HandleNmea(const std::string& sentence) {
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.nmea_sentences;
  }

  // GPGSV несёт только спутники — позиции нет, это не ошибка
  if (NmeaParser::Classify(sentence) == NmeaSentenceType::Gsv) {
    return;
  }

  auto fix = NmeaParser::Parse(sentence, config_.nmea_battery_voltage,
                               platform_.GetTimeMs());
  if (!fix) {
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.nmea_drops;
    }
    const int len =
        std::min(static_cast<int>(sentence.size()), kLogSentenceMax);
    LogFormatted(LogLevel::Warning, "NMEA sentence dropped: %.*s", len,
                 sentence.c_str());
    return;
  }

  Deliver(MessageDispatcher::Dispatch(*fix));
}

void LinkSession::Deliver(const TelemetryEvent& event) {
  if (const auto* rejected = std::get_if<RecordRejected>(&event)) {
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.range_rejections;
    }
    const std::string_view reason = protocol::ToString(rejected->error);
    LogFormatted(LogLevel::Warning, "Record 0x%02X rejected: %.*s",
                 rejected->message_id, static_cast<int>(reason.size()),
                 reason.data());
    return;
  }

  if (const auto* unknown = std::get_if<UnknownMessage>(&event)) {
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.unknown_messages;
    }
    LogFormatted(LogLevel::Warning, "Unknown message id 0x%02X",
                 unknown->message_id);
  }

  sink_.OnTelemetry(event);
}

// ═══════════════════════════════════════════════════════════════════════════
// Отправка
// ═══════════════════════════════════════════════════════════════════════════

bool LinkSession::WriteBytes(std::span<const uint8_t> data, const char* what) {
  std::lock_guard<std::mutex> lock(port_mutex_);

  if (state_.load() != LinkState::Connected || !port_ || !port_->IsOpen()) {
    {
      std::lock_guard<std::mutex> stats_lock(stats_mutex_);
      ++stats_.send_failures;
    }
    LogFormatted(LogLevel::Error, "Cannot send %s: not connected", what);
    return false;
  }

  auto result = port_->Write(data);
  if (IsError(result)) {
    const IoError err = GetError(result);
    {
      std::lock_guard<std::mutex> stats_lock(stats_mutex_);
      ++stats_.send_failures;
    }
    LogFormatted(LogLevel::Error, "Failed to send %s: %s (%d)", what,
                 err.message.c_str(), err.code);
    return false;
  }

  if (GetValue(result) != data.size()) {
    {
      std::lock_guard<std::mutex> stats_lock(stats_mutex_);
      ++stats_.send_failures;
    }
    LogFormatted(LogLevel::Error, "Short write of %s: %zu of %zu bytes", what,
                 GetValue(result), data.size());
    return false;
  }
  return true;
}

bool LinkSession::SendFrame(const protocol::Frame& frame) {
  if (!WriteBytes(frame, "frame")) {
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.frames_sent;
  }
  LogFormatted(LogLevel::Info, "Sent frame id=0x%02X", frame[2]);
  return true;
}

bool LinkSession::Send(uint8_t message_id, std::span<const uint8_t> payload) {
  return SendFrame(protocol::Protocol::BuildRaw(message_id, payload));
}

bool LinkSession::SendPidGain(protocol::PidAxis axis, float p, float i,
                              float d) {
  const std::string_view name = protocol::PidAxisName(axis);
  if (!PayloadDecoder::IsValidPidValue(p) ||
      !PayloadDecoder::IsValidPidValue(i) ||
      !PayloadDecoder::IsValidPidValue(d)) {
    LogFormatted(LogLevel::Error, "PID %.*s out of range: P=%f I=%f D=%f",
                 static_cast<int>(name.size()), name.data(),
                 static_cast<double>(p), static_cast<double>(i),
                 static_cast<double>(d));
    return false;
  }

  LogFormatted(LogLevel::Info, "Sending PID %.*s: P=%.4f I=%.4f D=%.4f",
               static_cast<int>(name.size()), name.data(),
               static_cast<double>(p), static_cast<double>(i),
               static_cast<double>(d));
  return SendFrame(protocol::Protocol::BuildPidGainSet(axis, p, i, d));
}

bool LinkSession::RequestPidGain(std::optional<protocol::PidAxis> axis) {
  const uint8_t target = axis ? static_cast<uint8_t>(*axis)
                              : protocol::PID_REQUEST_ALL;
  return SendFrame(protocol::Protocol::BuildPidGainRequest(target));
}

bool LinkSession::SendTerminal(std::string_view text, TerminalMode mode) {
  std::vector<uint8_t> data;

  if (mode == TerminalMode::Hex) {
    auto parsed = ParseHex(text);
    if (!parsed) {
      LogFormatted(LogLevel::Error, "Terminal send failed: invalid hex '%.*s'",
                   static_cast<int>(text.size()), text.data());
      return false;
    }
    data = std::move(*parsed);
  } else {
    for (char c : text) {
      if (static_cast<unsigned char>(c) > 0x7F) {
        LogFormatted(LogLevel::Error,
                     "Terminal send failed: non-ASCII character");
        return false;
      }
      data.push_back(static_cast<uint8_t>(c));
    }
  }

  if (!WriteBytes(data, "terminal data")) {
    return false;
  }
  LogFormatted(LogLevel::Info, "Terminal sent (%s): %.*s",
               mode == TerminalMode::Hex ? "hex" : "ascii",
               static_cast<int>(text.size()), text.data());
  return true;
}

std::optional<std::vector<uint8_t>> LinkSession::ParseHex(
    std::string_view text) {
  std::vector<uint8_t> out;
  size_t i = 0;
  while (i < text.size()) {
    if (IsSpace(text[i])) {
      ++i;
      continue;
    }
    if (i + 1 >= text.size()) {
      return std::nullopt;
    }
    const int hi = HexDigit(text[i]);
    const int lo = HexDigit(text[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    i += 2;
  }
  return out;
}

// ═══════════════════════════════════════════════════════════════════════════
// Состояние
// ═══════════════════════════════════════════════════════════════════════════

LinkStats LinkSession::GetStats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

std::string LinkSession::GetPortName() const {
  std::lock_guard<std::mutex> lock(port_mutex_);
  return port_name_;
}

void LinkSession::LogFormatted(LogLevel level, const char* fmt, ...) const {
  char buf[256];
  va_list args;
  va_start(args, fmt);
  const int n = vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);
  if (n <= 0) return;

  const size_t len = std::min(static_cast<size_t>(n), sizeof(buf) - 1);
  platform_.Log(level, std::string_view(buf, len));
}

}  // namespace gs_bridge
