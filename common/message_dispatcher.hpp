#pragma once

#include <cstdint>

#include "protocol.hpp"
#include "telemetry_types.hpp"

namespace gs_bridge {

/**
 * @brief Преобразование проверенных сообщений в события телеметрии
 *
 * Чистая функция: без побочных эффектов и состояния, результат зависит
 * только от входа. Обновление состояния, рассылка и логирование —
 * на стороне вызывающего.
 *
 * Маршрутизация по message_id (направление FC → GS):
 *   0x00–0x05 → PidAckReceived
 *   0x10      → AhrsUpdated
 *   0x11      → GpsUpdated
 *   0x12      → BatteryUpdated
 *   0x13      → EscUpdated
 *   0x14      → FlightModeChanged
 *   0x15      → GpsEnhancedUpdated
 *   иначе     → UnknownMessage
 * Запись, не прошедшая валидацию, → RecordRejected.
 */
class MessageDispatcher {
 public:
  /**
   * @param frame Кадр после FrameParser::Parse
   * @param now_ms Время приёма
   */
  [[nodiscard]] static TelemetryEvent Dispatch(
      const protocol::DecodedFrame& frame, uint32_t now_ms);

  /**
   * @param fix Позиция из NMEA-предложения
   */
  [[nodiscard]] static TelemetryEvent Dispatch(const GpsFix& fix);
};

}  // namespace gs_bridge
