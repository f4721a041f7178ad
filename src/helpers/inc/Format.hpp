#ifndef CASCADE_HELPERS_FORMAT_HPP
#define CASCADE_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable quantities for toString() and CLI output.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include <fmt/format.h>

namespace cascade {
namespace helpers {
namespace format {

/// Bytes with binary units, e.g. "1.5 GiB".
[[nodiscard]] inline std::string bytesBinary(std::uint64_t bytes) {
  static constexpr std::array<const char*, 5> UNITS{"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < UNITS.size()) {
    value /= 1024.0;
    ++unit;
  }
  if (unit == 0) {
    return fmt::format("{} B", bytes);
  }
  return fmt::format("{:.1f} {}", value, UNITS[unit]);
}

/// Bytes per second with binary units, e.g. "12.0 KiB/s".
[[nodiscard]] inline std::string rateBinary(double bytesPerSec) {
  return bytesBinary(bytesPerSec > 0.0 ? static_cast<std::uint64_t>(bytesPerSec) : 0) + "/s";
}

/// Optional value with unit, "n/a" when absent.
[[nodiscard]] inline std::string orNa(const std::optional<double>& value,
                                      const char* unit) {
  if (!value) {
    return "n/a";
  }
  return fmt::format("{:.1f}{}", *value, unit);
}

} // namespace format
} // namespace helpers
} // namespace cascade

#endif // CASCADE_HELPERS_FORMAT_HPP
