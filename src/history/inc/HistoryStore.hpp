#ifndef CASCADE_HISTORY_HISTORY_STORE_HPP
#define CASCADE_HISTORY_HISTORY_STORE_HPP
/**
 * @file HistoryStore.hpp
 * @brief Retention-bounded in-memory time series of flattened readings.
 *
 * Entries are appended in timestamp order. Every access first evicts entries
 * older than (now - retention), so the store only ever holds the trailing
 * window. Queries can downsample into minute/hour/day buckets (per-key mean)
 * and then decimate by a fixed stride to honor a result limit.
 *
 * @note Thread-safe: all operations take the store mutex.
 */

#include "src/helpers/inc/Clock.hpp"
#include "src/snapshot/inc/SensorReading.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

namespace cascade {
namespace history {

/* ----------------------------- Constants ----------------------------- */

inline constexpr std::int64_t DEFAULT_RETENTION_MS = 3'600'000; ///< 1 hour
inline constexpr std::size_t DEFAULT_QUERY_LIMIT = 1000;
inline constexpr std::int64_t DEFAULT_SENSOR_WINDOW_MS = 3'600'000;

/* ----------------------------- Types ----------------------------- */

/// One ingest tick: sensor path -> value.
struct HistoryEntry {
  std::int64_t timestamp{0};
  std::map<std::string, double> readings{};

  bool operator==(const HistoryEntry&) const = default;
};

enum class Resolution : std::uint8_t { Raw = 0, Minute, Hour, Day };

[[nodiscard]] const char* toString(Resolution res) noexcept;

/// Parse "raw", "minute", "hour" or "day".
[[nodiscard]] bool parseResolution(std::string_view text, Resolution& out) noexcept;

/// Bucket width in ms; 0 for Raw.
[[nodiscard]] std::int64_t bucketWidthMs(Resolution res) noexcept;

struct HistoryQuery {
  std::optional<std::int64_t> startTime{}; ///< Default 0
  std::optional<std::int64_t> endTime{};   ///< Default now
  Resolution resolution{Resolution::Raw};
  std::size_t limit{DEFAULT_QUERY_LIMIT}; ///< 0 disables decimation
};

struct SeriesPoint {
  std::int64_t timestamp{0};
  double value{0.0};
};

struct HistoryStats {
  std::size_t count{0};
  std::optional<std::int64_t> oldest{};
  std::optional<std::int64_t> newest{};
};

/// Fold a reading list into one entry keyed by source path (last value wins).
[[nodiscard]] HistoryEntry toHistoryEntry(const snapshot::ReadingList& readings,
                                          std::int64_t timestamp);

/**
 * @brief Bucket entries by floor(ts / width) * width and average each key.
 *
 * A key contributes only to buckets in which some entry defines it. Output is
 * in ascending bucket order.
 */
[[nodiscard]] std::vector<HistoryEntry> downsample(const std::vector<HistoryEntry>& entries,
                                                   std::int64_t widthMs);

/// Keep every ceil(n/limit)-th element when n > limit.
[[nodiscard]] std::vector<HistoryEntry> decimate(std::vector<HistoryEntry> entries,
                                                 std::size_t limit);

/* ----------------------------- HistoryStore ----------------------------- */

class HistoryStore {
public:
  /**
   * @param retentionMs Trailing window kept in memory.
   * @param clock Epoch-ms time source.
   * @param maxEntries Hard cap on stored entries; 0 = unbounded.
   */
  explicit HistoryStore(std::int64_t retentionMs = DEFAULT_RETENTION_MS,
                        helpers::clock::ClockFn clock = helpers::clock::systemClock(),
                        std::size_t maxEntries = 0);

  void ingest(HistoryEntry entry);

  /// Filtered, optionally downsampled and decimated entries. Empty if start > end.
  [[nodiscard]] std::vector<HistoryEntry> query(const HistoryQuery& q = {});

  /// {timestamp, value} for one key over the trailing durationMs.
  [[nodiscard]] std::vector<SeriesPoint>
  getSensorHistory(const std::string& path, std::int64_t durationMs = DEFAULT_SENSOR_WINDOW_MS);

  /// Readings of the newest entry; empty when the store is empty.
  [[nodiscard]] std::map<std::string, double> getLatestReadings();

  void clear();

  [[nodiscard]] HistoryStats getStats();

  void setRetention(std::int64_t retentionMs);
  [[nodiscard]] std::int64_t retentionMs() const;

private:
  void evictLocked(std::int64_t now);

  mutable std::mutex mtx_;
  std::deque<HistoryEntry> entries_;
  std::int64_t retentionMs_;
  helpers::clock::ClockFn clock_;
  std::size_t maxEntries_;
};

/* ----------------------------- JSON ----------------------------- */

[[nodiscard]] Json::Value toJson(const HistoryEntry& entry);
[[nodiscard]] Json::Value toJson(const std::vector<HistoryEntry>& entries);
[[nodiscard]] Json::Value toJson(const std::vector<SeriesPoint>& series);
[[nodiscard]] Json::Value toJson(const HistoryStats& stats);

} // namespace history
} // namespace cascade

#endif // CASCADE_HISTORY_HISTORY_STORE_HPP
