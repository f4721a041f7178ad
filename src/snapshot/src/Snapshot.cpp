/**
 * @file Snapshot.cpp
 * @brief toString() implementations for the snapshot records.
 */

#include "src/snapshot/inc/Snapshot.hpp"
#include "src/helpers/inc/Format.hpp"

#include <fmt/format.h>

namespace cascade {
namespace snapshot {

using cascade::helpers::format::bytesBinary;
using cascade::helpers::format::orNa;
using cascade::helpers::format::rateBinary;

/* ----------------------------- Records ----------------------------- */

std::string CpuData::toString() const {
  if (!present) {
    return "CPU: (unavailable)";
  }
  return fmt::format("CPU: {} ({} cores) load {:.1f}% temp {} @ {:.0f} MHz", brand, cores, load,
                     orNa(temperature, " C"), speedMhz);
}

std::string GpuData::toString() const {
  return fmt::format("GPU {}: {} [{}] load {} temp {} fan {} vram {}/{} MiB", index, name, vendor,
                     orNa(utilization, "%"), orNa(temperature, " C"),
                     orNa(fan, "%"), memoryUsedMiB, memoryTotalMiB);
}

std::string MemoryData::toString() const {
  if (!present) {
    return "Memory: (unavailable)";
  }
  return fmt::format("Memory: {} / {} ({:.1f}%) swap {} / {}", bytesBinary(usedBytes),
                     bytesBinary(totalBytes), usedPercent, bytesBinary(swapUsedBytes),
                     bytesBinary(swapTotalBytes));
}

std::string DiskData::toString() const {
  return fmt::format("Disk {}: {} on {} ({}) {} / {} ({:.1f}%)", index, device, mount, fsType,
                     bytesBinary(usedBytes), bytesBinary(sizeBytes), usePercent);
}

std::string NetworkData::toString() const {
  return fmt::format("Net {} [{}]: rx {} tx {}", iface, operstate, rateBinary(rxSec),
                     rateBinary(txSec));
}

/* ----------------------------- Snapshot ----------------------------- */

std::string Snapshot::toString() const {
  std::string out = fmt::format("Snapshot @ {} ms\n", timestamp);
  out += "  " + cpu.toString() + "\n";
  for (const GpuData& GPU : gpus) {
    out += "  " + GPU.toString() + "\n";
  }
  out += "  " + memory.toString() + "\n";
  for (const DiskData& DISK : disks) {
    out += "  " + DISK.toString() + "\n";
  }
  for (const NetworkData& NET : network) {
    out += "  " + NET.toString() + "\n";
  }
  return out;
}

} // namespace snapshot
} // namespace cascade
