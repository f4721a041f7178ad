#ifndef CASCADE_SOURCES_GPU_SOURCE_HPP
#define CASCADE_SOURCES_GPU_SOURCE_HPP
/**
 * @file GpuSource.hpp
 * @brief GPU adapter over DRM sysfs (/sys/class/drm/cardN/device).
 *
 * Reports what the kernel driver exposes: amdgpu gives busy percent, VRAM,
 * fan and power; other drivers usually expose only identity and hwmon
 * temperature. Vendor tools (nvidia-smi, NVML) are not used.
 *
 * @note Stateless; safe to call concurrently.
 */

#include "src/snapshot/inc/CategoryAdapter.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cascade {
namespace sources {

/// "amd", "intel", "nvidia" or "unknown" from a PCI vendor id ("0x1002").
[[nodiscard]] const char* vendorFromPciId(const std::string& vendorId) noexcept;

class GpuSource final : public snapshot::GpuAdapter {
public:
  explicit GpuSource(std::filesystem::path root = "/") : root_(std::move(root)) {}

  [[nodiscard]] const char* name() const noexcept override { return "gpu"; }

  /// Empty list (not a failure) when no DRM cards exist.
  [[nodiscard]] std::optional<std::vector<snapshot::GpuData>> collect() override;

private:
  std::filesystem::path root_;
};

} // namespace sources
} // namespace cascade

#endif // CASCADE_SOURCES_GPU_SOURCE_HPP
