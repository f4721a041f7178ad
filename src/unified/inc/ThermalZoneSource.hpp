#ifndef CASCADE_UNIFIED_THERMAL_ZONE_SOURCE_HPP
#define CASCADE_UNIFIED_THERMAL_ZONE_SOURCE_HPP
/**
 * @file ThermalZoneSource.hpp
 * @brief ACPI/SoC thermal zones under /sys/class/thermal.
 *
 * The zone's "critical" trip point, when present, is reported as max.
 */

#include "src/unified/inc/NormalizationSource.hpp"

#include <filesystem>
#include <utility>
#include <vector>

namespace cascade {
namespace unified {

class ThermalZoneSource final : public NormalizationSource {
public:
  explicit ThermalZoneSource(std::filesystem::path root = "/") : root_(std::move(root)) {}

  [[nodiscard]] const char* name() const noexcept override { return "thermal zones"; }
  [[nodiscard]] const char* tag() const noexcept override { return "thermal"; }

  [[nodiscard]] bool available() override;
  [[nodiscard]] std::vector<RawSensor> read() override;

private:
  std::filesystem::path root_;
};

} // namespace unified
} // namespace cascade

#endif // CASCADE_UNIFIED_THERMAL_ZONE_SOURCE_HPP
