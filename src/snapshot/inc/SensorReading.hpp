#ifndef CASCADE_SNAPSHOT_SENSOR_READING_HPP
#define CASCADE_SNAPSHOT_SENSOR_READING_HPP
/**
 * @file SensorReading.hpp
 * @brief Flat, path-addressed reading projected from a Snapshot.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace cascade {
namespace snapshot {

/* ----------------------------- ReadingType ----------------------------- */

enum class ReadingType : std::uint8_t {
  Temperature = 0,
  Voltage = 1,
  Fan = 2,
  Power = 3,
  Load = 4,
  Clock = 5,
  Data = 6,
};

/// Lower-case type name ("temperature", "load", ...).
[[nodiscard]] const char* toString(ReadingType type) noexcept;

/* ----------------------------- SensorReading ----------------------------- */

/**
 * @brief One value at a canonical dotted path such as "cpu.load".
 *
 * `source` is the canonical path; it is the key used by history and alerting.
 */
struct SensorReading {
  std::string name{};              ///< Display name
  ReadingType type{ReadingType::Data};
  double value{0.0};
  double min{0.0};
  double max{0.0};
  std::string unit{};
  std::string source{};            ///< Canonical path
  std::int64_t timestamp{0};       ///< Epoch ms of the originating snapshot

  [[nodiscard]] std::string toString() const;

  bool operator==(const SensorReading& other) const = default;
};

using ReadingList = std::vector<SensorReading>;

} // namespace snapshot
} // namespace cascade

#endif // CASCADE_SNAPSHOT_SENSOR_READING_HPP
