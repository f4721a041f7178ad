#ifndef CASCADE_SNAPSHOT_SNAPSHOT_JSON_HPP
#define CASCADE_SNAPSHOT_SNAPSHOT_JSON_HPP
/**
 * @file SnapshotJson.hpp
 * @brief JSON views of snapshots and readings for the subscriber protocol.
 *
 * Absent optional values serialize as null. A disabled CPU or memory
 * category serializes as an empty object; list categories as [].
 */

#include "src/snapshot/inc/SensorReading.hpp"
#include "src/snapshot/inc/Snapshot.hpp"

#include <json/json.h>

namespace cascade {
namespace snapshot {

[[nodiscard]] Json::Value toJson(const CpuData& cpu);
[[nodiscard]] Json::Value toJson(const GpuData& gpu);
[[nodiscard]] Json::Value toJson(const MemoryData& memory);
[[nodiscard]] Json::Value toJson(const DiskData& disk);
[[nodiscard]] Json::Value toJson(const NetworkData& net);
[[nodiscard]] Json::Value toJson(const Snapshot& snap);

[[nodiscard]] Json::Value toJson(const SensorReading& reading);
[[nodiscard]] Json::Value toJson(const ReadingList& readings);

/// Lists of GPU/disk/network records as JSON arrays.
[[nodiscard]] Json::Value gpusToJson(const std::vector<GpuData>& gpus);
[[nodiscard]] Json::Value disksToJson(const std::vector<DiskData>& disks);
[[nodiscard]] Json::Value networkToJson(const std::vector<NetworkData>& network);

} // namespace snapshot
} // namespace cascade

#endif // CASCADE_SNAPSHOT_SNAPSHOT_JSON_HPP
