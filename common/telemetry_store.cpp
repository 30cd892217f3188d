#include "telemetry_store.hpp"

#include <cmath>
#include <variant>

#include "config.hpp"

namespace gs_bridge {

namespace {

struct StoreVisitor {
  TelemetrySnapshot& state;

  void operator()(const AhrsUpdated& e) const {
    if (state.ahrs) {
      // Беззнаковая разность корректна и после переполнения счётчика мс
      const uint32_t dt_ms = e.sample.timestamp - state.ahrs->timestamp;
      if (dt_ms != 0) {
        state.ahrs_rate_hz = 1000.0f / static_cast<float>(dt_ms);
      }
    }
    state.ahrs = e.sample;
    ++state.ahrs_count;
  }

  void operator()(const GpsUpdated& e) const { state.gps = e.fix; }

  void operator()(const PidAckReceived& e) const {
    const auto index = static_cast<size_t>(e.gains.axis);
    if (index < state.pid_gains.size()) {
      state.pid_gains[index] = e.gains;
    }
  }

  void operator()(const BatteryUpdated& e) const { state.battery = e.status; }
  void operator()(const EscUpdated& e) const { state.esc = e.status; }

  void operator()(const FlightModeChanged& e) const {
    state.flight_mode = e.status;
  }

  void operator()(const GpsEnhancedUpdated& e) const {
    state.gps_enhanced = e.status;
  }

  void operator()(const UnknownMessage&) const { ++state.unknown_messages; }

  // Отклонённые записи в состояние не попадают
  void operator()(const RecordRejected&) const {}
};

}  // namespace

void TelemetryStore::OnTelemetry(const TelemetryEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(StoreVisitor{state_}, event);

  if (std::holds_alternative<GpsUpdated>(event) ||
      std::holds_alternative<GpsEnhancedUpdated>(event)) {
    UpdateDistanceToHome();
  }
}

void TelemetryStore::UpdateDistanceToHome() {
  if (!state_.gps || !state_.gps_enhanced) {
    state_.distance_to_home_m.reset();
    return;
  }

  const GpsFix& pos = *state_.gps;
  const GpsEnhancedStatus& nav = *state_.gps_enhanced;
  if (pos.latitude == 0.0 || pos.longitude == 0.0 || !nav.IsHomeSet()) {
    state_.distance_to_home_m.reset();
    return;
  }

  const double dlat = pos.latitude - nav.home_lat;
  const double dlon = pos.longitude - nav.home_lon;
  state_.distance_to_home_m = static_cast<float>(
      std::sqrt(dlat * dlat + dlon * dlon) *
      config::NavigationConfig::kMetersPerDegree);
}

TelemetrySnapshot TelemetryStore::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::optional<PidGainRecord> TelemetryStore::GetPidGains(
    protocol::PidAxis axis) const {
  const auto index = static_cast<size_t>(axis);
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= state_.pid_gains.size()) {
    return std::nullopt;
  }
  return state_.pid_gains[index];
}

void TelemetryStore::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = TelemetrySnapshot{};
}

}  // namespace gs_bridge
