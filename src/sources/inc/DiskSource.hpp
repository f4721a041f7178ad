#ifndef CASCADE_SOURCES_DISK_SOURCE_HPP
#define CASCADE_SOURCES_DISK_SOURCE_HPP
/**
 * @file DiskSource.hpp
 * @brief Disk adapter: mounted block-device filesystems with usage and temperature.
 * @note Linux-only. Uses /proc/mounts and statvfs(3).
 */

#include "src/snapshot/inc/CategoryAdapter.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cascade {
namespace sources {

/// One /proc/mounts line.
struct MountEntry {
  std::string device{};
  std::string mount{};
  std::string fsType{};
};

/**
 * @brief Parse /proc/mounts, keeping /dev/* devices only.
 *
 * A device mounted several times is reported once (first mount point).
 * Octal escapes ("\040" for space) in mount points are decoded.
 */
[[nodiscard]] std::vector<MountEntry> parseMounts(std::string_view text);

class DiskSource final : public snapshot::DiskAdapter {
public:
  explicit DiskSource(std::filesystem::path root = "/") : root_(std::move(root)) {}

  [[nodiscard]] const char* name() const noexcept override { return "disk"; }

  /// nullopt when /proc/mounts cannot be read.
  [[nodiscard]] std::optional<std::vector<snapshot::DiskData>> collect() override;

private:
  std::optional<double> driveTemperature(const std::string& device) const;

  std::filesystem::path root_;
};

} // namespace sources
} // namespace cascade

#endif // CASCADE_SOURCES_DISK_SOURCE_HPP
