#ifndef CASCADE_UNIFIED_HWMON_SOURCE_HPP
#define CASCADE_UNIFIED_HWMON_SOURCE_HPP
/**
 * @file HwmonSource.hpp
 * @brief Every hwmon chip channel under /sys/class/hwmon.
 *
 * Channels read: temp*, in*, fan*, power*, curr* (the *_input attribute),
 * with *_label, *_min, *_max/*_crit and *_alarm where the driver exposes them.
 * Values are converted from sysfs units (millidegree, millivolt, microwatt,
 * milliamp) to C, V, W and A.
 */

#include "src/unified/inc/NormalizationSource.hpp"

#include <filesystem>
#include <utility>
#include <vector>

namespace cascade {
namespace unified {

class HwmonSource final : public NormalizationSource {
public:
  explicit HwmonSource(std::filesystem::path root = "/") : root_(std::move(root)) {}

  [[nodiscard]] const char* name() const noexcept override { return "hwmon"; }
  [[nodiscard]] const char* tag() const noexcept override { return "hwmon"; }

  [[nodiscard]] bool available() override;
  [[nodiscard]] std::vector<RawSensor> read() override;

private:
  std::filesystem::path root_;
};

} // namespace unified
} // namespace cascade

#endif // CASCADE_UNIFIED_HWMON_SOURCE_HPP
