/**
 * @file SnapshotJson.cpp
 */

#include "src/snapshot/inc/SnapshotJson.hpp"
#include "src/helpers/inc/Json.hpp"

namespace cascade {
namespace snapshot {

using cascade::helpers::json::fromOptional;

namespace {

Json::Value u64(std::uint64_t v) { return Json::Value(static_cast<Json::UInt64>(v)); }

} // namespace

/* ----------------------------- Categories ----------------------------- */

Json::Value toJson(const CpuData& cpu) {
  Json::Value v(Json::objectValue);
  if (!cpu.present) {
    return v;
  }
  v["brand"] = cpu.brand;
  v["cores"] = cpu.cores;
  v["load"] = cpu.load;
  v["coreLoads"] = Json::Value(Json::arrayValue);
  for (const double LOAD : cpu.coreLoads) {
    v["coreLoads"].append(LOAD);
  }
  v["temperature"] = fromOptional(cpu.temperature);
  v["temperatureMax"] = fromOptional(cpu.temperatureMax);
  v["speed"] = cpu.speedMhz;
  return v;
}

Json::Value toJson(const GpuData& gpu) {
  Json::Value v(Json::objectValue);
  v["index"] = gpu.index;
  v["name"] = gpu.name;
  v["vendor"] = gpu.vendor;
  v["temperature"] = fromOptional(gpu.temperature);
  v["temperatureMax"] = fromOptional(gpu.temperatureMax);
  v["utilizationGpu"] = fromOptional(gpu.utilization);
  v["utilizationMemory"] = fromOptional(gpu.memoryUtilization);
  v["fanSpeed"] = fromOptional(gpu.fan);
  v["powerDraw"] = fromOptional(gpu.powerWatts);
  v["memoryTotal"] = u64(gpu.memoryTotalMiB);
  v["memoryUsed"] = u64(gpu.memoryUsedMiB);
  return v;
}

Json::Value toJson(const MemoryData& memory) {
  Json::Value v(Json::objectValue);
  if (!memory.present) {
    return v;
  }
  v["total"] = u64(memory.totalBytes);
  v["used"] = u64(memory.usedBytes);
  v["free"] = u64(memory.freeBytes);
  v["available"] = u64(memory.availableBytes);
  v["swapTotal"] = u64(memory.swapTotalBytes);
  v["swapUsed"] = u64(memory.swapUsedBytes);
  v["usedPercent"] = memory.usedPercent;
  return v;
}

Json::Value toJson(const DiskData& disk) {
  Json::Value v(Json::objectValue);
  v["index"] = disk.index;
  v["device"] = disk.device;
  v["mount"] = disk.mount;
  v["type"] = disk.fsType;
  v["size"] = u64(disk.sizeBytes);
  v["used"] = u64(disk.usedBytes);
  v["available"] = u64(disk.availableBytes);
  v["usePercent"] = disk.usePercent;
  v["temperature"] = fromOptional(disk.temperature);
  return v;
}

Json::Value toJson(const NetworkData& net) {
  Json::Value v(Json::objectValue);
  v["iface"] = net.iface;
  v["operstate"] = net.operstate;
  v["rxBytes"] = u64(net.rxBytes);
  v["txBytes"] = u64(net.txBytes);
  v["rxSec"] = net.rxSec;
  v["txSec"] = net.txSec;
  return v;
}

Json::Value gpusToJson(const std::vector<GpuData>& gpus) {
  Json::Value arr(Json::arrayValue);
  for (const GpuData& GPU : gpus) {
    arr.append(toJson(GPU));
  }
  return arr;
}

Json::Value disksToJson(const std::vector<DiskData>& disks) {
  Json::Value arr(Json::arrayValue);
  for (const DiskData& DISK : disks) {
    arr.append(toJson(DISK));
  }
  return arr;
}

Json::Value networkToJson(const std::vector<NetworkData>& network) {
  Json::Value arr(Json::arrayValue);
  for (const NetworkData& NET : network) {
    arr.append(toJson(NET));
  }
  return arr;
}

/* ----------------------------- Snapshot ----------------------------- */

Json::Value toJson(const Snapshot& snap) {
  Json::Value v(Json::objectValue);
  v["timestamp"] = static_cast<Json::Int64>(snap.timestamp);
  v["cpu"] = toJson(snap.cpu);
  v["gpu"] = gpusToJson(snap.gpus);
  v["memory"] = toJson(snap.memory);
  v["disks"] = disksToJson(snap.disks);
  v["network"] = networkToJson(snap.network);
  return v;
}

/* ----------------------------- Readings ----------------------------- */

Json::Value toJson(const SensorReading& reading) {
  Json::Value v(Json::objectValue);
  v["name"] = reading.name;
  v["type"] = toString(reading.type);
  v["value"] = reading.value;
  v["min"] = reading.min;
  v["max"] = reading.max;
  v["unit"] = reading.unit;
  v["source"] = reading.source;
  v["timestamp"] = static_cast<Json::Int64>(reading.timestamp);
  return v;
}

Json::Value toJson(const ReadingList& readings) {
  Json::Value arr(Json::arrayValue);
  for (const SensorReading& R : readings) {
    arr.append(toJson(R));
  }
  return arr;
}

} // namespace snapshot
} // namespace cascade
