#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

#include "link_config.hpp"
#include "link_session.hpp"
#include "posix_platform.hpp"
#include "protocol.hpp"
#include "telemetry_store.hpp"

using namespace gs_bridge;

static const char *TAG = "main";
static std::atomic<bool> s_running{true};

static void on_signal(int) { s_running.store(false); }

// ─────────────────────────────────────────────────────────────────────────
// Аргументы командной строки
// ─────────────────────────────────────────────────────────────────────────

struct PidCommand {
  protocol::PidAxis axis;
  float p;
  float i;
  float d;
};

struct RawCommand {
  uint8_t message_id;
  std::vector<uint8_t> payload;
};

struct CliOptions {
  LinkConfig link;
  bool list_ports{false};
  std::vector<PidCommand> pid_sets;
  std::vector<std::optional<protocol::PidAxis>> pid_requests;
  std::vector<RawCommand> raw_frames;
  std::vector<std::string> terminal_ascii;
  std::vector<std::string> terminal_hex;
};

static void print_usage(const char *prog) {
  std::printf(
      "Usage: %s [options]\n"
      "  --port <dev>           serial device (default: first found)\n"
      "  --baud <n>             baud rate (default 115200)\n"
      "  --attempts <n>         reconnect attempts (default 5)\n"
      "  --backoff-ms <n>       pause between reconnect attempts (default "
      "2000)\n"
      "  --timeout-ms <n>       read timeout (default 100)\n"
      "  --nmea-battery <V>     battery voltage reported for NMEA fixes\n"
      "  --list                 list serial ports and exit\n"
      "  --pid <axis>:<p>,<i>,<d>   set PID gains (axis: roll_inner, ...)\n"
      "  --request-pid <axis|all>   request PID gains\n"
      "  --raw <id>:<hex>       send raw GS frame (id in hex)\n"
      "  --terminal <text>      write ASCII text unframed\n"
      "  --terminal-hex <hex>   write hex bytes unframed\n",
      prog);
}

static std::optional<uint32_t> parse_uint(std::string_view s, int base = 10) {
  if (base == 16 && s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    s.remove_prefix(2);
  }
  uint32_t value = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, base);
  if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) {
    return std::nullopt;
  }
  return value;
}

static std::optional<float> parse_float(const std::string &s) {
  if (s.empty()) return std::nullopt;
  char *end = nullptr;
  const float value = std::strtof(s.c_str(), &end);
  if (end != s.c_str() + s.size()) return std::nullopt;
  return value;
}

// "roll_inner:1.0,0.1,0.01"
static std::optional<PidCommand> parse_pid(std::string_view arg) {
  const size_t colon = arg.find(':');
  if (colon == std::string_view::npos) return std::nullopt;

  const auto axis = protocol::ParsePidAxis(arg.substr(0, colon));
  if (!axis) return std::nullopt;

  std::string rest(arg.substr(colon + 1));
  float gains[3];
  size_t start = 0;
  for (int k = 0; k < 3; ++k) {
    const size_t comma = rest.find(',', start);
    const bool last = (k == 2);
    if (last != (comma == std::string::npos)) return std::nullopt;
    const auto value = parse_float(rest.substr(start, comma - start));
    if (!value) return std::nullopt;
    gains[k] = *value;
    start = comma + 1;
  }
  return PidCommand{*axis, gains[0], gains[1], gains[2]};
}

// "14:0102ff"
static std::optional<RawCommand> parse_raw(std::string_view arg) {
  const size_t colon = arg.find(':');
  if (colon == std::string_view::npos) return std::nullopt;

  const auto id = parse_uint(arg.substr(0, colon), 16);
  if (!id || *id > 0xFF) return std::nullopt;

  auto payload = LinkSession::ParseHex(arg.substr(colon + 1));
  if (!payload || payload->size() > protocol::PAYLOAD_SIZE) return std::nullopt;
  return RawCommand{static_cast<uint8_t>(*id), std::move(*payload)};
}

static bool parse_args(int argc, char **argv, CliOptions &opts) {
  for (int k = 1; k < argc; ++k) {
    const std::string_view flag = argv[k];
    if (flag == "--list") {
      opts.list_ports = true;
      continue;
    }
    if (k + 1 >= argc) {
      std::fprintf(stderr, "[%s] Missing value for %s\n", TAG, argv[k]);
      return false;
    }
    const std::string_view value = argv[++k];

    if (flag == "--port") {
      opts.link.port = std::string(value);
    } else if (flag == "--baud" || flag == "--attempts" ||
               flag == "--backoff-ms" || flag == "--timeout-ms") {
      const auto n = parse_uint(value);
      if (!n) {
        std::fprintf(stderr, "[%s] Invalid number for %s: %s\n", TAG,
                     argv[k - 1], argv[k]);
        return false;
      }
      if (flag == "--baud") opts.link.baud = *n;
      if (flag == "--attempts") opts.link.max_reconnect_attempts = *n;
      if (flag == "--backoff-ms") opts.link.reconnect_backoff_ms = *n;
      if (flag == "--timeout-ms") opts.link.read_timeout_ms = *n;
    } else if (flag == "--nmea-battery") {
      const auto v = parse_float(std::string(value));
      if (!v) {
        std::fprintf(stderr, "[%s] Invalid voltage: %s\n", TAG, argv[k]);
        return false;
      }
      opts.link.nmea_battery_voltage = *v;
    } else if (flag == "--pid") {
      const auto cmd = parse_pid(value);
      if (!cmd) {
        std::fprintf(stderr, "[%s] Invalid --pid: %s\n", TAG, argv[k]);
        return false;
      }
      opts.pid_sets.push_back(*cmd);
    } else if (flag == "--request-pid") {
      if (value == "all") {
        opts.pid_requests.push_back(std::nullopt);
      } else {
        const auto axis = protocol::ParsePidAxis(value);
        if (!axis) {
          std::fprintf(stderr, "[%s] Unknown PID axis: %s\n", TAG, argv[k]);
          return false;
        }
        opts.pid_requests.push_back(*axis);
      }
    } else if (flag == "--raw") {
      auto cmd = parse_raw(value);
      if (!cmd) {
        std::fprintf(stderr, "[%s] Invalid --raw: %s\n", TAG, argv[k]);
        return false;
      }
      opts.raw_frames.push_back(std::move(*cmd));
    } else if (flag == "--terminal") {
      opts.terminal_ascii.emplace_back(value);
    } else if (flag == "--terminal-hex") {
      opts.terminal_hex.emplace_back(value);
    } else {
      std::fprintf(stderr, "[%s] Unknown option: %s\n", TAG, argv[k - 1]);
      return false;
    }
  }

  if (!opts.link.IsValid()) {
    std::fprintf(stderr, "[%s] Link settings out of range, clamping\n", TAG);
    opts.link.Clamp();
  }
  return true;
}

// ─────────────────────────────────────────────────────────────────────────
// Вывод телеметрии
// ─────────────────────────────────────────────────────────────────────────

struct EventPrinter {
  void operator()(const AhrsUpdated &e) const {
    const auto &s = e.sample;
    std::printf("ahrs roll=%.2f pitch=%.2f yaw=%.2f alt=%.1f\n",
                static_cast<double>(s.roll), static_cast<double>(s.pitch),
                static_cast<double>(s.yaw), static_cast<double>(s.altitude));
  }
  void operator()(const GpsUpdated &e) const {
    const auto &f = e.fix;
    std::printf("gps lat=%.7f lon=%.7f alt=%.1f sats=%u fix=%u batt=%.2fV%s\n",
                f.latitude, f.longitude, static_cast<double>(f.altitude),
                f.satellites, f.fix_quality,
                static_cast<double>(f.battery_voltage),
                f.IsFailsafeTriggered() ? " FAILSAFE" : "");
  }
  void operator()(const PidAckReceived &e) const {
    const auto name = protocol::PidAxisName(e.gains.axis);
    std::printf("pid %.*s P=%.4f I=%.4f D=%.4f\n",
                static_cast<int>(name.size()), name.data(),
                static_cast<double>(e.gains.p), static_cast<double>(e.gains.i),
                static_cast<double>(e.gains.d));
  }
  void operator()(const BatteryUpdated &e) const {
    const auto &b = e.status;
    std::printf("battery %.2fV %.2fA %umAh cells=%u remaining=%umAh\n",
                static_cast<double>(b.voltage), static_cast<double>(b.current),
                static_cast<unsigned>(b.consumption_mah), b.cells,
                b.remaining_capacity);
  }
  void operator()(const EscUpdated &e) const {
    std::printf("esc");
    for (const auto &m : e.status.per_motor) {
      std::printf(" [%uC %.1fV %.1fA]", m.temperature,
                  static_cast<double>(m.voltage),
                  static_cast<double>(m.current));
    }
    std::printf("\n");
  }
  void operator()(const FlightModeChanged &e) const {
    const auto mode = e.status.ModeName();
    const auto arming = e.status.ArmingStateName();
    std::printf("mode %.*s %s %.*s\n", static_cast<int>(mode.size()),
                mode.data(), e.status.armed ? "ARMED" : "DISARMED",
                static_cast<int>(arming.size()), arming.data());
  }
  void operator()(const GpsEnhancedUpdated &e) const {
    const auto &g = e.status;
    std::printf("gps+ fix=%u sats=%u hdop=%.2f vdop=%.2f home=%.7f,%.7f\n",
                g.fix_type, g.satellites_visible, static_cast<double>(g.hdop),
                static_cast<double>(g.vdop), g.home_lat, g.home_lon);
  }
  void operator()(const UnknownMessage &e) const {
    std::printf("unknown id=0x%02X\n", e.message_id);
  }
  void operator()(const RecordRejected &) const {}
};

/** Sink хоста: обновляет хранилище и печатает событие в stdout. */
class PrintingSink : public TelemetrySink {
 public:
  explicit PrintingSink(TelemetryStore &store) : store_(store) {}

  void OnTelemetry(const TelemetryEvent &event) override {
    store_.OnTelemetry(event);
    std::visit(EventPrinter{}, event);
    std::fflush(stdout);
  }

 private:
  TelemetryStore &store_;
};

static void send_commands(LinkSession &session, const CliOptions &opts) {
  for (const auto &cmd : opts.pid_sets) {
    if (!session.SendPidGain(cmd.axis, cmd.p, cmd.i, cmd.d)) {
      std::fprintf(stderr, "[%s] PID set failed\n", TAG);
    }
  }
  for (const auto &axis : opts.pid_requests) {
    if (!session.RequestPidGain(axis)) {
      std::fprintf(stderr, "[%s] PID request failed\n", TAG);
    }
  }
  for (const auto &raw : opts.raw_frames) {
    if (!session.Send(raw.message_id, raw.payload)) {
      std::fprintf(stderr, "[%s] Raw frame 0x%02X failed\n", TAG,
                   raw.message_id);
    }
  }
  for (const auto &text : opts.terminal_ascii) {
    if (!session.SendTerminal(text, TerminalMode::Ascii)) {
      std::fprintf(stderr, "[%s] Terminal write failed\n", TAG);
    }
  }
  for (const auto &text : opts.terminal_hex) {
    if (!session.SendTerminal(text, TerminalMode::Hex)) {
      std::fprintf(stderr, "[%s] Terminal hex write failed\n", TAG);
    }
  }
}

static void print_summary(const LinkSession &session,
                          const TelemetryStore &store) {
  const LinkStats stats = session.GetStats();
  const TelemetrySnapshot snap = store.Snapshot();

  std::fprintf(stderr,
               "[%s] rx=%llu bytes, frames=%u, checksum_err=%u, sync_err=%u, "
               "rejected=%u, unknown=%u, nmea=%u (dropped %u), overflows=%u, "
               "reconnects=%u, sent=%u (failed %u)\n",
               TAG, static_cast<unsigned long long>(stats.bytes_received),
               stats.frames_decoded, stats.checksum_errors, stats.sync_errors,
               stats.range_rejections, stats.unknown_messages,
               stats.nmea_sentences, stats.nmea_drops, stats.overflow_resets,
               stats.reconnect_attempts, stats.frames_sent,
               stats.send_failures);
  std::fprintf(stderr, "[%s] AHRS %u samples, %.1f Hz", TAG, snap.ahrs_count,
               static_cast<double>(snap.ahrs_rate_hz));
  if (snap.distance_to_home_m) {
    std::fprintf(stderr, ", %.0f m to home",
                 static_cast<double>(*snap.distance_to_home_m));
  }
  std::fprintf(stderr, "\n");
}

int main(int argc, char **argv) {
  CliOptions opts;
  if (!parse_args(argc, argv, opts)) {
    print_usage(argv[0]);
    return 1;
  }

  PosixPlatform platform;

  if (opts.list_ports) {
    for (const auto &port : platform.ListPorts()) {
      std::printf("%s\t%s\n", port.device.c_str(), port.description.c_str());
    }
    return 0;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  TelemetryStore store;
  PrintingSink sink(store);
  LinkSession session(platform, sink, opts.link);

  if (protocol::IsError(session.Connect())) {
    return 1;
  }

  send_commands(session, opts);

  if (!session.Start()) {
    std::fprintf(stderr, "[%s] Failed to start reader\n", TAG);
    return 1;
  }

  while (s_running.load() && session.GetState() != LinkState::Disconnected) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  const bool link_lost = session.GetState() == LinkState::Disconnected;
  session.Disconnect();
  print_summary(session, store);
  return link_lost ? 2 : 0;
}
