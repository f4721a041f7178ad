#ifndef CASCADE_SNAPSHOT_SNAPSHOT_HPP
#define CASCADE_SNAPSHOT_SNAPSHOT_HPP
/**
 * @file Snapshot.hpp
 * @brief Point-in-time capture of every monitored hardware category.
 *
 * A Snapshot is composed once per collection cycle and then shared as
 * `std::shared_ptr<const Snapshot>`; it is never modified after publication.
 * Every category is always present: a disabled or failed category holds its
 * default value (present == false, or an empty list).
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cascade {
namespace snapshot {

/* ----------------------------- CpuData ----------------------------- */

struct CpuData {
  bool present{false};                   ///< False when disabled or the adapter failed
  std::string brand{};                   ///< Model name
  std::uint32_t cores{0};                ///< Logical CPU count
  double load{0.0};                      ///< Aggregate utilization (%)
  std::vector<double> coreLoads{};       ///< Per-CPU utilization (%)
  std::optional<double> temperature{};   ///< Package temperature (C)
  std::optional<double> temperatureMax{}; ///< Critical/max temperature (C)
  double speedMhz{0.0};                  ///< Mean current frequency

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- GpuData ----------------------------- */

struct GpuData {
  std::uint32_t index{0};                  ///< Position in Snapshot::gpus
  std::string name{};                      ///< Device name or PCI id
  std::string vendor{};                    ///< "amd", "intel", "nvidia", ...
  std::optional<double> temperature{};     ///< Edge/core temperature (C)
  std::optional<double> temperatureMax{};  ///< Critical temperature (C)
  std::optional<double> utilization{};     ///< Busy percent
  std::optional<double> memoryUtilization{}; ///< VRAM used percent
  std::optional<double> fan{};             ///< Fan speed percent
  std::optional<double> powerWatts{};      ///< Board power (W)
  std::uint64_t memoryTotalMiB{0};         ///< VRAM size
  std::uint64_t memoryUsedMiB{0};          ///< VRAM in use

  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- MemoryData ----------------------------- */

struct MemoryData {
  bool present{false};
  std::uint64_t totalBytes{0};
  std::uint64_t usedBytes{0};
  std::uint64_t freeBytes{0};
  std::uint64_t availableBytes{0};
  std::uint64_t swapTotalBytes{0};
  std::uint64_t swapUsedBytes{0};
  double usedPercent{0.0}; ///< used / total (%)

  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- DiskData ----------------------------- */

struct DiskData {
  std::uint32_t index{0};
  std::string device{};   ///< e.g. /dev/nvme0n1p2
  std::string mount{};    ///< Mount point
  std::string fsType{};   ///< e.g. ext4
  std::uint64_t sizeBytes{0};
  std::uint64_t usedBytes{0};
  std::uint64_t availableBytes{0};
  double usePercent{0.0};
  std::optional<double> temperature{}; ///< Drive temperature when exposed (C)

  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- NetworkData ----------------------------- */

struct NetworkData {
  std::string iface{};
  std::string operstate{}; ///< "up", "down", "unknown"
  std::uint64_t rxBytes{0};
  std::uint64_t txBytes{0};
  double rxSec{0.0}; ///< Receive rate (bytes/s) since previous sample
  double txSec{0.0}; ///< Transmit rate (bytes/s) since previous sample

  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Snapshot ----------------------------- */

struct Snapshot {
  std::int64_t timestamp{0}; ///< Epoch milliseconds
  CpuData cpu{};
  std::vector<GpuData> gpus{};
  MemoryData memory{};
  std::vector<DiskData> disks{};
  std::vector<NetworkData> network{};

  /// @brief Multi-line summary for CLI output.
  [[nodiscard]] std::string toString() const;
};

/// Shared immutable handle to a published snapshot.
using SnapshotPtr = std::shared_ptr<const Snapshot>;

} // namespace snapshot
} // namespace cascade

#endif // CASCADE_SNAPSHOT_SNAPSHOT_HPP
