/**
 * @file HistoryStore.cpp
 * @brief Time-series storage, downsampling and decimation.
 */

#include "src/history/inc/HistoryStore.hpp"
#include "src/helpers/inc/Json.hpp"
#include "src/helpers/inc/Log.hpp"

#include <utility>

namespace cascade {
namespace history {

namespace {

constexpr const char* LOG_CAT = "history";

constexpr std::int64_t MINUTE_MS = 60'000;
constexpr std::int64_t HOUR_MS = 60 * MINUTE_MS;
constexpr std::int64_t DAY_MS = 24 * HOUR_MS;

/// floor(ts / width) * width, correct for negative ts.
std::int64_t bucketKey(std::int64_t ts, std::int64_t width) noexcept {
  std::int64_t q = ts / width;
  if (ts % width != 0 && ts < 0) {
    --q;
  }
  return q * width;
}

struct Accum {
  double sum{0.0};
  std::size_t count{0};
};

} // namespace

/* ----------------------------- Resolution ----------------------------- */

const char* toString(Resolution res) noexcept {
  switch (res) {
  case Resolution::Raw:
    return "raw";
  case Resolution::Minute:
    return "minute";
  case Resolution::Hour:
    return "hour";
  case Resolution::Day:
    return "day";
  }
  return "raw";
}

bool parseResolution(std::string_view text, Resolution& out) noexcept {
  if (text == "raw") {
    out = Resolution::Raw;
  } else if (text == "minute") {
    out = Resolution::Minute;
  } else if (text == "hour") {
    out = Resolution::Hour;
  } else if (text == "day") {
    out = Resolution::Day;
  } else {
    return false;
  }
  return true;
}

std::int64_t bucketWidthMs(Resolution res) noexcept {
  switch (res) {
  case Resolution::Minute:
    return MINUTE_MS;
  case Resolution::Hour:
    return HOUR_MS;
  case Resolution::Day:
    return DAY_MS;
  case Resolution::Raw:
    break;
  }
  return 0;
}

/* ----------------------------- Free functions ----------------------------- */

HistoryEntry toHistoryEntry(const snapshot::ReadingList& readings, std::int64_t timestamp) {
  HistoryEntry entry{};
  entry.timestamp = timestamp;
  for (const snapshot::SensorReading& R : readings) {
    entry.readings[R.source] = R.value;
  }
  return entry;
}

std::vector<HistoryEntry> downsample(const std::vector<HistoryEntry>& entries,
                                     std::int64_t widthMs) {
  if (widthMs <= 0) {
    return entries;
  }
  std::map<std::int64_t, std::map<std::string, Accum>> buckets;
  for (const HistoryEntry& E : entries) {
    auto& bucket = buckets[bucketKey(E.timestamp, widthMs)];
    for (const auto& [KEY, VALUE] : E.readings) {
      Accum& acc = bucket[KEY];
      acc.sum += VALUE;
      ++acc.count;
    }
  }

  std::vector<HistoryEntry> out;
  out.reserve(buckets.size());
  for (const auto& [TS, KEYS] : buckets) {
    HistoryEntry avg{};
    avg.timestamp = TS;
    for (const auto& [KEY, ACC] : KEYS) {
      avg.readings[KEY] = ACC.sum / static_cast<double>(ACC.count);
    }
    out.push_back(std::move(avg));
  }
  return out;
}

std::vector<HistoryEntry> decimate(std::vector<HistoryEntry> entries, std::size_t limit) {
  if (limit == 0 || entries.size() <= limit) {
    return entries;
  }
  const std::size_t STEP = (entries.size() + limit - 1) / limit;
  std::vector<HistoryEntry> out;
  out.reserve(entries.size() / STEP + 1);
  for (std::size_t i = 0; i < entries.size(); i += STEP) {
    out.push_back(std::move(entries[i]));
  }
  return out;
}

/* ----------------------------- HistoryStore ----------------------------- */

HistoryStore::HistoryStore(std::int64_t retentionMs, helpers::clock::ClockFn clock,
                           std::size_t maxEntries)
    : retentionMs_(retentionMs), clock_(std::move(clock)), maxEntries_(maxEntries) {}

void HistoryStore::evictLocked(std::int64_t now) {
  const std::int64_t CUTOFF = now - retentionMs_;
  while (!entries_.empty() && entries_.front().timestamp < CUTOFF) {
    entries_.pop_front();
  }
  while (maxEntries_ > 0 && entries_.size() > maxEntries_) {
    entries_.pop_front();
  }
}

void HistoryStore::ingest(HistoryEntry entry) {
  const std::int64_t NOW = clock_();
  std::lock_guard<std::mutex> lock(mtx_);
  entries_.push_back(std::move(entry));
  evictLocked(NOW);
}

std::vector<HistoryEntry> HistoryStore::query(const HistoryQuery& q) {
  const std::int64_t NOW = clock_();
  const std::int64_t START = q.startTime.value_or(0);
  const std::int64_t END = q.endTime.value_or(NOW);
  if (START > END) {
    helpers::log::debug(LOG_CAT, "empty query window [{}, {}]", START, END);
    return {};
  }

  std::vector<HistoryEntry> filtered;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    evictLocked(NOW);
    for (const HistoryEntry& E : entries_) {
      if (E.timestamp >= START && E.timestamp <= END) {
        filtered.push_back(E);
      }
    }
  }

  if (q.resolution != Resolution::Raw) {
    filtered = downsample(filtered, bucketWidthMs(q.resolution));
  }
  return decimate(std::move(filtered), q.limit);
}

std::vector<SeriesPoint> HistoryStore::getSensorHistory(const std::string& path,
                                                        std::int64_t durationMs) {
  const std::int64_t NOW = clock_();
  const std::int64_t START = NOW - durationMs;

  std::vector<SeriesPoint> out;
  std::lock_guard<std::mutex> lock(mtx_);
  evictLocked(NOW);
  for (const HistoryEntry& E : entries_) {
    if (E.timestamp < START) {
      continue;
    }
    const auto IT = E.readings.find(path);
    if (IT != E.readings.end()) {
      out.push_back({E.timestamp, IT->second});
    }
  }
  return out;
}

std::map<std::string, double> HistoryStore::getLatestReadings() {
  const std::int64_t NOW = clock_();
  std::lock_guard<std::mutex> lock(mtx_);
  evictLocked(NOW);
  if (entries_.empty()) {
    return {};
  }
  return entries_.back().readings;
}

void HistoryStore::clear() {
  std::lock_guard<std::mutex> lock(mtx_);
  entries_.clear();
  helpers::log::info(LOG_CAT, "history cleared");
}

HistoryStats HistoryStore::getStats() {
  const std::int64_t NOW = clock_();
  std::lock_guard<std::mutex> lock(mtx_);
  evictLocked(NOW);
  HistoryStats stats{};
  stats.count = entries_.size();
  if (!entries_.empty()) {
    stats.oldest = entries_.front().timestamp;
    stats.newest = entries_.back().timestamp;
  }
  return stats;
}

void HistoryStore::setRetention(std::int64_t retentionMs) {
  const std::int64_t NOW = clock_();
  std::lock_guard<std::mutex> lock(mtx_);
  retentionMs_ = retentionMs;
  evictLocked(NOW);
}

std::int64_t HistoryStore::retentionMs() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return retentionMs_;
}

/* ----------------------------- JSON ----------------------------- */

Json::Value toJson(const HistoryEntry& entry) {
  Json::Value v(Json::objectValue);
  v["timestamp"] = static_cast<Json::Int64>(entry.timestamp);
  Json::Value readings(Json::objectValue);
  for (const auto& [KEY, VALUE] : entry.readings) {
    readings[KEY] = VALUE;
  }
  v["readings"] = readings;
  return v;
}

Json::Value toJson(const std::vector<HistoryEntry>& entries) {
  Json::Value arr(Json::arrayValue);
  for (const HistoryEntry& E : entries) {
    arr.append(toJson(E));
  }
  return arr;
}

Json::Value toJson(const std::vector<SeriesPoint>& series) {
  Json::Value arr(Json::arrayValue);
  for (const SeriesPoint& P : series) {
    Json::Value p(Json::objectValue);
    p["timestamp"] = static_cast<Json::Int64>(P.timestamp);
    p["value"] = P.value;
    arr.append(p);
  }
  return arr;
}

Json::Value toJson(const HistoryStats& stats) {
  Json::Value v(Json::objectValue);
  v["entries"] = static_cast<Json::UInt64>(stats.count);
  v["oldestTimestamp"] = helpers::json::fromOptional(stats.oldest);
  v["newestTimestamp"] = helpers::json::fromOptional(stats.newest);
  return v;
}

} // namespace history
} // namespace cascade
