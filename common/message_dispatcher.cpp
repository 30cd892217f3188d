#include "message_dispatcher.hpp"

#include "payload_decoder.hpp"

namespace gs_bridge {

namespace {

/**
 * Обернуть результат декодера в событие: значение → Event{value},
 * ошибка → RecordRejected.
 */
template <typename Event, typename T>
TelemetryEvent Wrap(uint8_t message_id, const PayloadResult<T>& result) {
  if (protocol::IsError(result)) {
    return RecordRejected{message_id, protocol::GetError(result)};
  }
  return Event{protocol::GetValue(result)};
}

}  // namespace

TelemetryEvent MessageDispatcher::Dispatch(const protocol::DecodedFrame& frame,
                                           uint32_t now_ms) {
  const uint8_t id = frame.message_id;
  const std::span<const uint8_t> payload(frame.payload);

  if (protocol::IsPidMessage(id)) {
    return Wrap<PidAckReceived>(
        id, PayloadDecoder::DecodePidGain(static_cast<protocol::PidAxis>(id),
                                          payload, now_ms));
  }

  switch (id) {
    case protocol::msg_id::AHRS:
      return Wrap<AhrsUpdated>(id, PayloadDecoder::DecodeAhrs(payload, now_ms));
    case protocol::msg_id::GPS:
      return Wrap<GpsUpdated>(id, PayloadDecoder::DecodeGps(payload, now_ms));
    case protocol::msg_id::BATTERY:
      return Wrap<BatteryUpdated>(
          id, PayloadDecoder::DecodeBattery(payload, now_ms));
    case protocol::msg_id::ESC:
      return Wrap<EscUpdated>(id, PayloadDecoder::DecodeEsc(payload, now_ms));
    case protocol::msg_id::FLIGHT_MODE:
      return Wrap<FlightModeChanged>(
          id, PayloadDecoder::DecodeFlightMode(payload, now_ms));
    case protocol::msg_id::GPS_ENHANCED:
      return Wrap<GpsEnhancedUpdated>(
          id, PayloadDecoder::DecodeGpsEnhanced(payload, now_ms));
    default:
      break;
  }

  return UnknownMessage{id};
}

TelemetryEvent MessageDispatcher::Dispatch(const GpsFix& fix) {
  return GpsUpdated{fix};
}

}  // namespace gs_bridge
