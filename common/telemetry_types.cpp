#include "telemetry_types.hpp"

namespace gs_bridge {

std::string_view FlightModeStatus::ModeName() const noexcept {
  switch (mode) {
    case FlightMode::Manual:
      return "MANUAL";
    case FlightMode::Stabilize:
      return "STABILIZE";
    case FlightMode::AltHold:
      return "ALT_HOLD";
    case FlightMode::Auto:
      return "AUTO";
    case FlightMode::Rtl:
      return "RTL";
    case FlightMode::Land:
      return "LAND";
    case FlightMode::Unknown:
      break;
  }
  return "UNKNOWN";
}

std::string_view FlightModeStatus::ArmingStateName() const noexcept {
  switch (arming_state) {
    case ArmingState::Standby:
      return "STANDBY";
    case ArmingState::Arming:
      return "ARMING";
    case ArmingState::Armed:
      return "ARMED";
    case ArmingState::Disarming:
      return "DISARMING";
  }
  return "UNKNOWN";
}

namespace {

struct EventNameVisitor {
  std::string_view operator()(const AhrsUpdated&) const { return "ahrs"; }
  std::string_view operator()(const GpsUpdated&) const { return "gps"; }
  std::string_view operator()(const PidAckReceived&) const {
    return "pid_ack";
  }
  std::string_view operator()(const BatteryUpdated&) const {
    return "battery";
  }
  std::string_view operator()(const EscUpdated&) const { return "esc"; }
  std::string_view operator()(const FlightModeChanged&) const {
    return "flight_mode";
  }
  std::string_view operator()(const GpsEnhancedUpdated&) const {
    return "gps_enhanced";
  }
  std::string_view operator()(const UnknownMessage&) const {
    return "unknown";
  }
  std::string_view operator()(const RecordRejected&) const {
    return "rejected";
  }
};

}  // namespace

std::string_view EventName(const TelemetryEvent& event) noexcept {
  return std::visit(EventNameVisitor{}, event);
}

}  // namespace gs_bridge
