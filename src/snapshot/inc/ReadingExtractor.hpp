#ifndef CASCADE_SNAPSHOT_READING_EXTRACTOR_HPP
#define CASCADE_SNAPSHOT_READING_EXTRACTOR_HPP
/**
 * @file ReadingExtractor.hpp
 * @brief Snapshot -> ordered SensorReading list.
 *
 * Paths, in emission order:
 *  - cpu.load, cpu.temperature
 *  - gpu.<i>.load, gpu.<i>.temperature, gpu.<i>.memory, gpu.<i>.fan
 *  - memory.used
 *  - disk.<i>.usage, disk.<i>.temperature
 *  - network.rx, network.tx (summed over interfaces)
 *
 * A path is emitted only when its sub-record (or optional field) is present.
 *
 * @note Pure function: no I/O, no shared state. Thread-safe.
 */

#include "src/snapshot/inc/SensorReading.hpp"
#include "src/snapshot/inc/Snapshot.hpp"

namespace cascade {
namespace snapshot {

/// Upper bound reported for cpu.temperature when the source gives none.
inline constexpr double DEFAULT_CPU_TEMP_MAX = 100.0;

/// Upper bound reported for disk.<i>.temperature.
inline constexpr double DEFAULT_DISK_TEMP_MAX = 70.0;

/**
 * @brief Flatten a snapshot into canonical readings.
 * @return Same snapshot in, same list out (same order).
 */
[[nodiscard]] ReadingList extractReadings(const Snapshot& snap);

} // namespace snapshot
} // namespace cascade

#endif // CASCADE_SNAPSHOT_READING_EXTRACTOR_HPP
