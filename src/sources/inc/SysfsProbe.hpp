#ifndef CASCADE_SOURCES_SYSFS_PROBE_HPP
#define CASCADE_SOURCES_SYSFS_PROBE_HPP
/**
 * @file SysfsProbe.hpp
 * @brief hwmon lookups shared by the category sources.
 *
 * All paths are resolved under a caller-supplied root so that tests can point
 * the sources at a fabricated tree.
 */

#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cascade {
namespace sources {

namespace fs = std::filesystem;

/// Highest tempN_input of a hwmon directory and its crit/max bound (C).
struct ChipTemperature {
  std::optional<double> value{};
  std::optional<double> max{};
};

/// Read millidegree attribute as degrees; nullopt when absent or unreadable.
[[nodiscard]] inline std::optional<double> readMilliCelsius(const fs::path& path) noexcept {
  constexpr std::int64_t NO_VALUE = INT64_MIN;
  const std::int64_t RAW = helpers::files::readInt64(path, NO_VALUE);
  if (RAW == NO_VALUE) {
    return std::nullopt;
  }
  return static_cast<double>(RAW) / 1000.0;
}

/**
 * @brief Scan temp*_input under one hwmon directory.
 *
 * The hottest input wins; its temp*_crit (or temp*_max) becomes the bound.
 */
[[nodiscard]] inline ChipTemperature readChipTemperature(const fs::path& hwmonDir) noexcept {
  ChipTemperature out{};
  for (const fs::path& P : helpers::files::listDir(hwmonDir, "temp")) {
    const std::string NAME = P.filename().string();
    if (!helpers::strings::endsWith(NAME, "_input")) {
      continue;
    }
    const std::optional<double> VALUE = readMilliCelsius(P);
    if (!VALUE || (out.value && *out.value >= *VALUE)) {
      continue;
    }
    out.value = VALUE;

    const std::string STEM = NAME.substr(0, NAME.size() - 6); // strip "_input"
    std::optional<double> bound = readMilliCelsius(hwmonDir / (STEM + "_crit"));
    if (!bound) {
      bound = readMilliCelsius(hwmonDir / (STEM + "_max"));
    }
    out.max = bound;
  }
  return out;
}

/// First /sys/class/hwmon/hwmonN whose `name` is one of names.
[[nodiscard]] inline std::optional<fs::path>
findHwmonByName(const fs::path& root, std::initializer_list<std::string_view> names) noexcept {
  for (const fs::path& DIR : helpers::files::listDir(root / "sys/class/hwmon", "hwmon")) {
    const std::string CHIP = helpers::files::readLine(DIR / "name");
    for (const std::string_view WANT : names) {
      if (CHIP == WANT) {
        return DIR;
      }
    }
  }
  return std::nullopt;
}

/// First hwmonN directory below dir (e.g. a PCI device's hwmon/).
[[nodiscard]] inline std::optional<fs::path> firstHwmonUnder(const fs::path& dir) noexcept {
  const std::vector<fs::path> FOUND = helpers::files::listDir(dir / "hwmon", "hwmon");
  if (FOUND.empty()) {
    return std::nullopt;
  }
  return FOUND.front();
}

} // namespace sources
} // namespace cascade

#endif // CASCADE_SOURCES_SYSFS_PROBE_HPP
