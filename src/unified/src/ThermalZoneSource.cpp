/**
 * @file ThermalZoneSource.cpp
 * @brief Thermal zone scan.
 */

#include "src/unified/inc/ThermalZoneSource.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <climits>
#include <cstdint>
#include <optional>
#include <string>

namespace cascade {
namespace unified {

namespace {

namespace fs = std::filesystem;

constexpr std::int64_t NO_VALUE = INT64_MIN;

std::optional<double> readCelsius(const fs::path& path) noexcept {
  const std::int64_t RAW = helpers::files::readInt64(path, NO_VALUE);
  if (RAW == NO_VALUE) {
    return std::nullopt;
  }
  return static_cast<double>(RAW) / 1000.0;
}

/// Temperature of the zone's "critical" trip point.
std::optional<double> criticalTrip(const fs::path& zone) {
  for (const fs::path& P : helpers::files::listDir(zone, "trip_point_")) {
    const std::string FILE = P.filename().string();
    if (!helpers::strings::endsWith(FILE, "_type")) {
      continue;
    }
    if (helpers::files::readLine(P) != "critical") {
      continue;
    }
    const std::string STEM = FILE.substr(0, FILE.size() - 5);
    return readCelsius(zone / (STEM + "_temp"));
  }
  return std::nullopt;
}

} // namespace

bool ThermalZoneSource::available() {
  return !helpers::files::listDir(root_ / "sys/class/thermal", "thermal_zone").empty();
}

std::vector<RawSensor> ThermalZoneSource::read() {
  std::vector<RawSensor> out;
  for (const fs::path& ZONE : helpers::files::listDir(root_ / "sys/class/thermal", "thermal_zone")) {
    const std::optional<double> TEMP = readCelsius(ZONE / "temp");
    if (!TEMP) {
      continue;
    }
    RawSensor s{};
    s.id = ZONE.filename().string();
    s.name = helpers::files::readLine(ZONE / "type");
    if (s.name.empty()) {
      s.name = s.id;
    }
    s.typeLabel = "temperature";
    s.value = *TEMP;
    s.max = criticalTrip(ZONE);
    s.unit = "°C";
    s.hardware = "thermal";
    out.push_back(std::move(s));
  }
  return out;
}

} // namespace unified
} // namespace cascade
