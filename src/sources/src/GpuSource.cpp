/**
 * @file GpuSource.cpp
 * @brief DRM sysfs GPU telemetry.
 */

#include "src/sources/inc/GpuSource.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/sources/inc/SysfsProbe.hpp"

#include <fmt/format.h>

namespace cascade {
namespace sources {

namespace {

constexpr std::uint64_t MIB = 1024ULL * 1024ULL;

/// Optional non-negative integer attribute.
std::optional<std::int64_t> readCounter(const fs::path& path) {
  const std::int64_t V = helpers::files::readInt64(path, -1);
  if (V < 0) {
    return std::nullopt;
  }
  return V;
}

snapshot::GpuData readCard(const fs::path& card) {
  const fs::path DEV = card / "device";
  snapshot::GpuData gpu{};

  gpu.vendor = vendorFromPciId(helpers::files::readLine(DEV / "vendor"));
  std::string label = helpers::files::readLine(DEV / "product_name");
  if (label.empty()) {
    label = helpers::files::readLine(DEV / "label");
  }
  if (label.empty()) {
    label = fmt::format("{} {}", gpu.vendor, helpers::files::readLine(DEV / "device"));
  }
  gpu.name = label;

  if (const auto BUSY = readCounter(DEV / "gpu_busy_percent")) {
    gpu.utilization = static_cast<double>(*BUSY);
  }

  const auto VRAM_TOTAL = readCounter(DEV / "mem_info_vram_total");
  const auto VRAM_USED = readCounter(DEV / "mem_info_vram_used");
  if (VRAM_TOTAL && *VRAM_TOTAL > 0) {
    gpu.memoryTotalMiB = static_cast<std::uint64_t>(*VRAM_TOTAL) / MIB;
    if (VRAM_USED) {
      gpu.memoryUsedMiB = static_cast<std::uint64_t>(*VRAM_USED) / MIB;
      gpu.memoryUtilization =
          static_cast<double>(*VRAM_USED) * 100.0 / static_cast<double>(*VRAM_TOTAL);
    }
  }

  if (const auto HWMON = firstHwmonUnder(DEV)) {
    const ChipTemperature T = readChipTemperature(*HWMON);
    gpu.temperature = T.value;
    gpu.temperatureMax = T.max;

    const auto PWM = readCounter(*HWMON / "pwm1");
    const auto PWM_MAX = readCounter(*HWMON / "pwm1_max");
    if (PWM) {
      const double SCALE = (PWM_MAX && *PWM_MAX > 0) ? static_cast<double>(*PWM_MAX) : 255.0;
      gpu.fan = static_cast<double>(*PWM) * 100.0 / SCALE;
    }

    auto power = readCounter(*HWMON / "power1_average");
    if (!power) {
      power = readCounter(*HWMON / "power1_input");
    }
    if (power) {
      gpu.powerWatts = static_cast<double>(*power) / 1'000'000.0;
    }
  }
  return gpu;
}

} // namespace

const char* vendorFromPciId(const std::string& vendorId) noexcept {
  if (vendorId.find("1002") != std::string::npos) {
    return "amd";
  }
  if (vendorId.find("8086") != std::string::npos) {
    return "intel";
  }
  if (vendorId.find("10de") != std::string::npos) {
    return "nvidia";
  }
  return "unknown";
}

std::optional<std::vector<snapshot::GpuData>> GpuSource::collect() {
  std::vector<snapshot::GpuData> gpus;
  for (const fs::path& CARD : helpers::files::listDir(root_ / "sys/class/drm", "card")) {
    // cardN only; cardN-HDMI-A-1 and friends are connectors
    if (CARD.filename().string().find('-') != std::string::npos) {
      continue;
    }
    if (!helpers::files::pathExists(CARD / "device")) {
      continue;
    }
    snapshot::GpuData gpu = readCard(CARD);
    gpu.index = static_cast<std::uint32_t>(gpus.size());
    gpus.push_back(std::move(gpu));
  }
  return gpus;
}

} // namespace sources
} // namespace cascade
