/**
 * @file ReadingExtractor.cpp
 * @brief Canonical path projection of a Snapshot.
 */

#include "src/snapshot/inc/ReadingExtractor.hpp"

#include <utility>

#include <fmt/format.h>

namespace cascade {
namespace snapshot {

namespace {

constexpr const char* UNIT_PERCENT = "%";
constexpr const char* UNIT_CELSIUS = "°C";
constexpr const char* UNIT_RATE = "B/s";

/// Appends readings stamped with one timestamp.
class ReadingSink {
public:
  ReadingSink(ReadingList& out, std::int64_t ts) : out_(out), ts_(ts) {}

  void add(std::string name, ReadingType type, double value, double min, double max,
           const char* unit, std::string source) {
    SensorReading r{};
    r.name = std::move(name);
    r.type = type;
    r.value = value;
    r.min = min;
    r.max = max;
    r.unit = unit;
    r.source = std::move(source);
    r.timestamp = ts_;
    out_.push_back(std::move(r));
  }

private:
  ReadingList& out_;
  std::int64_t ts_;
};

void extractCpu(const CpuData& cpu, ReadingSink& sink) {
  if (!cpu.present) {
    return;
  }
  sink.add("CPU Load", ReadingType::Load, cpu.load, 0.0, 100.0, UNIT_PERCENT, "cpu.load");
  if (cpu.temperature) {
    sink.add("CPU Temperature", ReadingType::Temperature, *cpu.temperature, 0.0,
             cpu.temperatureMax.value_or(DEFAULT_CPU_TEMP_MAX), UNIT_CELSIUS, "cpu.temperature");
  }
}

void extractGpu(const GpuData& gpu, std::size_t i, ReadingSink& sink) {
  const std::string PREFIX = fmt::format("gpu.{}", i);
  const std::string LABEL = gpu.name.empty() ? fmt::format("GPU {}", i) : gpu.name;

  if (gpu.utilization) {
    sink.add(LABEL + " Load", ReadingType::Load, *gpu.utilization, 0.0, 100.0, UNIT_PERCENT,
             PREFIX + ".load");
  }
  if (gpu.temperature) {
    sink.add(LABEL + " Temperature", ReadingType::Temperature, *gpu.temperature, 0.0,
             gpu.temperatureMax.value_or(DEFAULT_CPU_TEMP_MAX), UNIT_CELSIUS,
             PREFIX + ".temperature");
  }
  if (gpu.memoryUtilization) {
    sink.add(LABEL + " Memory", ReadingType::Load, *gpu.memoryUtilization, 0.0, 100.0,
             UNIT_PERCENT, PREFIX + ".memory");
  }
  if (gpu.fan) {
    sink.add(LABEL + " Fan", ReadingType::Fan, *gpu.fan, 0.0, 100.0, UNIT_PERCENT,
             PREFIX + ".fan");
  }
}

void extractDisk(const DiskData& disk, std::size_t i, ReadingSink& sink) {
  const std::string PREFIX = fmt::format("disk.{}", i);
  const std::string LABEL = disk.mount.empty() ? fmt::format("Disk {}", i) : disk.mount;

  sink.add(LABEL + " Usage", ReadingType::Load, disk.usePercent, 0.0, 100.0, UNIT_PERCENT,
           PREFIX + ".usage");
  if (disk.temperature && *disk.temperature > 0.0) {
    sink.add(LABEL + " Temperature", ReadingType::Temperature, *disk.temperature, 0.0,
             DEFAULT_DISK_TEMP_MAX, UNIT_CELSIUS, PREFIX + ".temperature");
  }
}

} // namespace

/* ----------------------------- API ----------------------------- */

ReadingList extractReadings(const Snapshot& snap) {
  ReadingList out;
  out.reserve(4 + snap.gpus.size() * 4 + snap.disks.size() * 2);
  ReadingSink sink(out, snap.timestamp);

  extractCpu(snap.cpu, sink);

  for (std::size_t i = 0; i < snap.gpus.size(); ++i) {
    extractGpu(snap.gpus[i], i, sink);
  }

  if (snap.memory.present) {
    sink.add("Memory Used", ReadingType::Load, snap.memory.usedPercent, 0.0, 100.0, UNIT_PERCENT,
             "memory.used");
  }

  for (std::size_t i = 0; i < snap.disks.size(); ++i) {
    extractDisk(snap.disks[i], i, sink);
  }

  if (!snap.network.empty()) {
    double rx = 0.0;
    double tx = 0.0;
    for (const NetworkData& NET : snap.network) {
      rx += NET.rxSec;
      tx += NET.txSec;
    }
    sink.add("Network Receive", ReadingType::Data, rx, 0.0, 0.0, UNIT_RATE, "network.rx");
    sink.add("Network Transmit", ReadingType::Data, tx, 0.0, 0.0, UNIT_RATE, "network.tx");
  }

  return out;
}

} // namespace snapshot
} // namespace cascade
