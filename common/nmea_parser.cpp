#include "nmea_parser.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <cstring>

namespace gs_bridge {

namespace {

constexpr size_t MAX_FIELDS = 24;
constexpr size_t GGA_MIN_FIELDS = 15;
constexpr size_t RMC_MIN_FIELDS = 12;

using Fields = std::array<std::string_view, MAX_FIELDS>;

std::string_view Trim(std::string_view s) noexcept {
  constexpr std::string_view kWs = " \t\r\n";
  const size_t first = s.find_first_not_of(kWs);
  if (first == std::string_view::npos) {
    return {};
  }
  const size_t last = s.find_last_not_of(kWs);
  return s.substr(first, last - first + 1);
}

/** Разбить по ','. Возвращает число полей (не больше MAX_FIELDS). */
size_t Split(std::string_view s, Fields& out) noexcept {
  size_t count = 0;
  size_t start = 0;
  while (count < MAX_FIELDS) {
    const size_t comma = s.find(',', start);
    if (comma == std::string_view::npos) {
      out[count++] = s.substr(start);
      break;
    }
    out[count++] = s.substr(start, comma - start);
    start = comma + 1;
  }
  return count;
}

bool ParseDouble(std::string_view s, double& out) noexcept {
  if (s.empty()) {
    out = 0.0;
    return true;
  }
  std::array<char, 32> buf{};
  if (s.size() >= buf.size()) {
    return false;
  }
  std::memcpy(buf.data(), s.data(), s.size());
  char* end = nullptr;
  out = std::strtod(buf.data(), &end);
  return end == buf.data() + s.size();
}

template <typename Int>
bool ParseInt(std::string_view s, Int& out) noexcept {
  if (s.empty()) {
    out = 0;
    return true;
  }
  const auto res = std::from_chars(s.data(), s.data() + s.size(), out);
  return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

/** Общая проверка формата: '$', ровно один '*', код типа. */
bool HasValidFrame(std::string_view s) noexcept {
  return s.size() >= 6 && s.front() == '$' &&
         std::count(s.begin(), s.end(), '*') == 1;
}

std::optional<GpsFix> ParseGga(const Fields& f, size_t n, float battery_v,
                               uint32_t now_ms) noexcept {
  if (n < GGA_MIN_FIELDS) {
    return std::nullopt;
  }

  auto lat = NmeaParser::ParseCoordinate(f[2], f[3], 2);
  auto lon = NmeaParser::ParseCoordinate(f[4], f[5], 3);
  if (!lat || !lon) {
    return std::nullopt;
  }

  GpsFix fix;
  fix.latitude = *lat;
  fix.longitude = *lon;

  double hdop = 0.0;
  double altitude = 0.0;
  if (!ParseInt(f[6], fix.fix_quality) || !ParseInt(f[7], fix.satellites) ||
      !ParseDouble(f[8], hdop) || !ParseDouble(f[9], altitude)) {
    return std::nullopt;
  }
  fix.hdop = static_cast<float>(hdop);
  fix.altitude = static_cast<float>(altitude);
  fix.battery_voltage = battery_v;
  fix.source = GpsSource::Nmea;
  fix.timestamp = now_ms;
  return fix;
}

std::optional<GpsFix> ParseRmc(const Fields& f, size_t n, float battery_v,
                               uint32_t now_ms) noexcept {
  if (n < RMC_MIN_FIELDS) {
    return std::nullopt;
  }

  auto lat = NmeaParser::ParseCoordinate(f[3], f[4], 2);
  auto lon = NmeaParser::ParseCoordinate(f[5], f[6], 3);
  if (!lat || !lon) {
    return std::nullopt;
  }

  GpsFix fix;
  fix.latitude = *lat;
  fix.longitude = *lon;
  fix.fix_quality = (f[2] == "A") ? 1 : 0;
  fix.battery_voltage = battery_v;
  fix.source = GpsSource::Nmea;
  fix.timestamp = now_ms;
  return fix;
}

}  // namespace

NmeaSentenceType NmeaParser::Classify(std::string_view sentence) noexcept {
  const std::string_view s = Trim(sentence);
  if (!HasValidFrame(s)) {
    return NmeaSentenceType::Invalid;
  }

  const std::string_view type = s.substr(1, 5);
  if (type == "GPGGA") return NmeaSentenceType::Gga;
  if (type == "GPRMC") return NmeaSentenceType::Rmc;
  if (type == "GPGSV") return NmeaSentenceType::Gsv;
  return NmeaSentenceType::Unsupported;
}

std::optional<GpsFix> NmeaParser::Parse(std::string_view sentence,
                                        float default_battery_voltage,
                                        uint32_t now_ms) noexcept {
  const std::string_view s = Trim(sentence);
  const NmeaSentenceType type = Classify(s);

  Fields fields{};
  const size_t n = Split(s, fields);

  switch (type) {
    case NmeaSentenceType::Gga:
      return ParseGga(fields, n, default_battery_voltage, now_ms);
    case NmeaSentenceType::Rmc:
      return ParseRmc(fields, n, default_battery_voltage, now_ms);
    case NmeaSentenceType::Gsv:
      // Только спутники — позиции нет
      return std::nullopt;
    case NmeaSentenceType::Unsupported:
    case NmeaSentenceType::Invalid:
      break;
  }
  return std::nullopt;
}

std::optional<double> NmeaParser::ParseCoordinate(std::string_view value,
                                                  std::string_view hemisphere,
                                                  size_t deg_digits) noexcept {
  if (value.empty() || value == "0") {
    return 0.0;
  }
  if (value.size() <= deg_digits) {
    return std::nullopt;
  }

  double degrees = 0.0;
  double minutes = 0.0;
  if (!ParseDouble(value.substr(0, deg_digits), degrees) ||
      !ParseDouble(value.substr(deg_digits), minutes)) {
    return std::nullopt;
  }

  double result = degrees + minutes / 60.0;
  if (hemisphere == "S" || hemisphere == "W") {
    result = -result;
  }
  return result;
}

}  // namespace gs_bridge
