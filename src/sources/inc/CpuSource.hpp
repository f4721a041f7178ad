#ifndef CASCADE_SOURCES_CPU_SOURCE_HPP
#define CASCADE_SOURCES_CPU_SOURCE_HPP
/**
 * @file CpuSource.hpp
 * @brief CPU adapter: /proc/stat load, /proc/cpuinfo identity, hwmon temperature.
 * @note Linux-only. Load is a delta between successive collect() calls; the
 *       first call reports 0%.
 */

#include "src/snapshot/inc/CategoryAdapter.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cascade {
namespace sources {

/* ----------------------------- Parsing ----------------------------- */

/// Cumulative jiffies for one cpu line.
struct CpuTimes {
  std::uint64_t total{0}; ///< Sum of all fields
  std::uint64_t idle{0};  ///< idle + iowait
};

/// Parsed /proc/stat cpu lines.
struct ProcStat {
  CpuTimes aggregate{};
  std::vector<CpuTimes> perCore{};
};

/// Parse the cpu and cpuN lines of /proc/stat; other lines are ignored.
[[nodiscard]] ProcStat parseProcStat(std::string_view text);

/// Busy percentage between two samples; 0 when no time elapsed.
[[nodiscard]] double busyPercent(const CpuTimes& before, const CpuTimes& after) noexcept;

/// Identity fields from /proc/cpuinfo.
struct CpuInfo {
  std::string brand{};   ///< First "model name"
  std::uint32_t cpus{0}; ///< Count of "processor" entries
  double meanMhz{0.0};   ///< Mean of "cpu MHz" values
};

[[nodiscard]] CpuInfo parseCpuInfo(std::string_view text);

/* ----------------------------- CpuSource ----------------------------- */

class CpuSource final : public snapshot::CpuAdapter {
public:
  /// @param root Filesystem root holding proc/ and sys/ ("/" on a live host).
  explicit CpuSource(std::filesystem::path root = "/");

  [[nodiscard]] const char* name() const noexcept override { return "cpu"; }

  /// nullopt when /proc/stat cannot be read.
  [[nodiscard]] std::optional<snapshot::CpuData> collect() override;

private:
  std::filesystem::path root_;
  std::mutex mtx_;
  std::optional<ProcStat> prev_{};
};

} // namespace sources
} // namespace cascade

#endif // CASCADE_SOURCES_CPU_SOURCE_HPP
