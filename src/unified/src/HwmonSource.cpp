/**
 * @file HwmonSource.cpp
 * @brief hwmon channel scan.
 */

#include "src/unified/inc/HwmonSource.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <array>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cascade {
namespace unified {

namespace {

namespace fs = std::filesystem;

/// One hwmon channel family.
struct Channel {
  std::string_view prefix; ///< Attribute prefix ("temp", "in", ...)
  const char* typeLabel;
  const char* unit;
  double scale; ///< Divisor from sysfs units
};

constexpr std::array<Channel, 5> CHANNELS{{
    {"temp", "temperature", "°C", 1000.0},
    {"in", "voltage", "V", 1000.0},
    {"fan", "fan", "RPM", 1.0},
    {"power", "power", "W", 1'000'000.0},
    {"curr", "current", "A", 1000.0},
}};

constexpr std::int64_t NO_VALUE = INT64_MIN;

std::optional<double> readScaled(const fs::path& path, double scale) noexcept {
  const std::int64_t RAW = helpers::files::readInt64(path, NO_VALUE);
  if (RAW == NO_VALUE) {
    return std::nullopt;
  }
  return static_cast<double>(RAW) / scale;
}

/// Channel family of an attribute stem such as "temp1"; nullptr if none.
const Channel* channelOf(std::string_view stem) noexcept {
  for (const Channel& C : CHANNELS) {
    if (helpers::strings::startsWith(stem, C.prefix) && stem.size() > C.prefix.size()) {
      const char NEXT = stem[C.prefix.size()];
      if (NEXT >= '0' && NEXT <= '9') {
        return &C;
      }
    }
  }
  return nullptr;
}

void readChip(const fs::path& dir, std::vector<RawSensor>& out) {
  std::string chip = helpers::files::readLine(dir / "name");
  if (chip.empty()) {
    chip = dir.filename().string();
  }

  for (const fs::path& P : helpers::files::listDir(dir)) {
    const std::string FILE = P.filename().string();
    if (!helpers::strings::endsWith(FILE, "_input")) {
      continue;
    }
    const std::string STEM = FILE.substr(0, FILE.size() - 6);
    const Channel* CH = channelOf(STEM);
    if (CH == nullptr) {
      continue;
    }
    const std::optional<double> VALUE = readScaled(P, CH->scale);
    if (!VALUE) {
      continue;
    }

    RawSensor s{};
    s.id = dir.filename().string() + "-" + STEM;
    s.name = helpers::files::readLine(dir / (STEM + "_label"));
    if (s.name.empty()) {
      s.name = STEM;
    }
    s.typeLabel = CH->typeLabel;
    s.value = *VALUE;
    s.unit = CH->unit;
    s.hardware = chip;
    s.min = readScaled(dir / (STEM + "_min"), CH->scale);
    s.max = readScaled(dir / (STEM + "_crit"), CH->scale);
    if (!s.max) {
      s.max = readScaled(dir / (STEM + "_max"), CH->scale);
    }
    if (!s.max && CH->prefix == "power") {
      s.max = readScaled(dir / (STEM + "_cap"), CH->scale);
    }
    s.alarm = helpers::files::readInt64(dir / (STEM + "_alarm"), 0) == 1 ||
              helpers::files::readInt64(dir / (STEM + "_crit_alarm"), 0) == 1;
    out.push_back(std::move(s));
  }
}

} // namespace

bool HwmonSource::available() {
  return !helpers::files::listDir(root_ / "sys/class/hwmon", "hwmon").empty();
}

std::vector<RawSensor> HwmonSource::read() {
  std::vector<RawSensor> out;
  for (const fs::path& DIR : helpers::files::listDir(root_ / "sys/class/hwmon", "hwmon")) {
    readChip(DIR, out);
  }
  return out;
}

} // namespace unified
} // namespace cascade
