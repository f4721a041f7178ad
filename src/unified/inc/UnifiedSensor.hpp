#ifndef CASCADE_UNIFIED_UNIFIED_SENSOR_HPP
#define CASCADE_UNIFIED_UNIFIED_SENSOR_HPP
/**
 * @file UnifiedSensor.hpp
 * @brief Canonical sensor model fused from several source subsystems.
 *
 * Each source reports RawSensor entries with its own type labels. They are
 * mapped onto SensorType through a fixed table, and a health Status is derived
 * from the value alone (no history).
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

namespace cascade {
namespace unified {

/* ----------------------------- Enums ----------------------------- */

enum class SensorType : std::uint8_t {
  Temperature = 0,
  Voltage,
  Fan,
  Power,
  Clock,
  Load,
  Current,
  Other
};

enum class Status : std::uint8_t { Ok = 0, Warning, Critical };

[[nodiscard]] const char* toString(SensorType type) noexcept;
[[nodiscard]] const char* toString(Status status) noexcept;

/// Map a source's native type label; unknown labels become Other.
[[nodiscard]] SensorType mapType(std::string_view label) noexcept;

/* ----------------------------- Status ----------------------------- */

/// Fraction of max at or above which a temperature is a warning / critical.
inline constexpr double TEMP_WARN_RATIO = 0.85;
inline constexpr double TEMP_CRIT_RATIO = 0.95;
/// Absolute temperature thresholds (C) when max is unknown.
inline constexpr double TEMP_WARN_ABS = 80.0;
inline constexpr double TEMP_CRIT_ABS = 90.0;
/// Voltage deviation from nominal.
inline constexpr double VOLT_WARN_DEVIATION = 0.05;
inline constexpr double VOLT_CRIT_DEVIATION = 0.10;
/// A fan below this RPM on a fan rated above FAN_FAST_MAX_RPM is suspicious.
inline constexpr double FAN_STALL_RPM = 200.0;
inline constexpr double FAN_FAST_MAX_RPM = 1000.0;

/**
 * @brief Health status from a single value.
 *
 * @param type Canonical type.
 * @param value Current value.
 * @param max Rated maximum (temperature bound, fan max).
 * @param nominal Expected voltage; max is used when absent.
 * @param alarm Hardware alarm flag; forces Critical.
 */
[[nodiscard]] Status deriveStatus(SensorType type, double value, std::optional<double> max,
                                  std::optional<double> nominal, bool alarm) noexcept;

/* ----------------------------- RawSensor ----------------------------- */

/// One sensor as a source reports it.
struct RawSensor {
  std::string id{};                      ///< Unique within the source
  std::string name{};                    ///< Display label
  std::string typeLabel{};               ///< Native type ("temperature", "level", ...)
  double value{0.0};                     ///< Current value
  std::optional<double> min{};           ///< Lower bound, if reported
  std::optional<double> max{};           ///< Upper bound, if reported
  std::optional<double> nominal{};       ///< Expected value (voltages)
  std::string unit{};                    ///< Unit string
  std::string hardware{};                ///< Chip or device the sensor belongs to
  bool alarm{false};                     ///< Hardware alarm flag
  std::optional<Status> reportedStatus{}; ///< Status asserted by the source (e.g. a BMC)
};

/* ----------------------------- UnifiedSensor ----------------------------- */

struct UnifiedSensor {
  std::string id{};   ///< "<source tag>-<native id>"
  std::string name{};
  SensorType type{SensorType::Other};
  double value{0.0};
  std::optional<double> min{};
  std::optional<double> max{};
  std::string unit{};
  std::string source{}; ///< Source provenance tag
  std::string hardware{};
  Status status{Status::Ok};

  /// "id name=value unit [status]".
  [[nodiscard]] std::string toString() const;
};

/// Normalize one raw sensor from the source tagged `tag`.
[[nodiscard]] UnifiedSensor normalize(const RawSensor& raw, std::string_view tag);

/* ----------------------------- UnifiedData ----------------------------- */

/// Availability of one source in a merge.
struct SourceState {
  std::string name{};
  std::string tag{};
  bool available{false};
  std::size_t sensorCount{0};
};

/// Result of one merge across every registered source.
struct UnifiedData {
  std::vector<UnifiedSensor> sensors{};
  std::vector<SourceState> sources{};
  std::int64_t timestamp{0}; ///< Epoch ms

  /// Sensors of one type, in merge order.
  [[nodiscard]] std::vector<UnifiedSensor> ofType(SensorType type) const;

  [[nodiscard]] std::vector<UnifiedSensor> criticalSensors() const;
  [[nodiscard]] std::vector<UnifiedSensor> warningSensors() const;
};

/* ----------------------------- JSON ----------------------------- */

[[nodiscard]] Json::Value toJson(const UnifiedSensor& sensor);

/// Sensors, per-type views, source availability and timestamp.
[[nodiscard]] Json::Value toJson(const UnifiedData& data);

} // namespace unified
} // namespace cascade

#endif // CASCADE_UNIFIED_UNIFIED_SENSOR_HPP
