#ifndef CASCADE_SNAPSHOT_SNAPSHOT_COMPOSER_HPP
#define CASCADE_SNAPSHOT_SNAPSHOT_COMPOSER_HPP
/**
 * @file SnapshotComposer.hpp
 * @brief Periodic, non-overlapping collection of hardware snapshots.
 *
 * Each cycle:
 *  1. Copies the enabled-category set from MonitorSettings.
 *  2. Runs every enabled adapter concurrently (one std::async task each).
 *  3. Joins them; a failed adapter yields its category's default value.
 *  4. Stamps the snapshot with max(clock, previous timestamp).
 *  5. Replaces the cache, then notifies snapshot observers and readings
 *     observers, in registration order, on the polling thread.
 *
 * Only one cycle runs at a time. Timer ticks skip while a cycle is in flight;
 * poll() waits for it and then runs its own cycle.
 *
 * @note Observers run while the cycle lock is held and must not call poll().
 */

#include "src/helpers/inc/Clock.hpp"
#include "src/snapshot/inc/CategoryAdapter.hpp"
#include "src/snapshot/inc/MonitorSettings.hpp"
#include "src/snapshot/inc/SensorReading.hpp"
#include "src/snapshot/inc/Snapshot.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace cascade {
namespace snapshot {

/// Lower bound on the timer interval.
inline constexpr std::uint32_t MIN_POLL_INTERVAL_MS = 100;

class SnapshotComposer {
public:
  using SnapshotObserver = std::function<void(const SnapshotPtr&)>;
  using ReadingsObserver = std::function<void(const SnapshotPtr&, const ReadingList&)>;

  SnapshotComposer(AdapterSet adapters, MonitorSettings& settings,
                   helpers::clock::ClockFn clock = helpers::clock::systemClock());
  ~SnapshotComposer();

  SnapshotComposer(const SnapshotComposer&) = delete;
  SnapshotComposer& operator=(const SnapshotComposer&) = delete;

  /// Register a `snapshot` observer. Call before start().
  void onSnapshot(SnapshotObserver observer);

  /// Register a `readings` observer. Call before start().
  void onReadings(ReadingsObserver observer);

  /**
   * @brief Poll once now, then every intervalMs on a timer thread.
   * @note No-op (logged) when already running. Interval is clamped to
   *       MIN_POLL_INTERVAL_MS.
   */
  void start(std::uint32_t intervalMs);

  /// Cancel the timer and join its thread. Idempotent.
  void stop();

  [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

  /// Run one cycle, waiting for any in-flight cycle first.
  SnapshotPtr poll();

  /// Run one cycle unless one is in flight; returns null when skipped.
  SnapshotPtr tryPoll();

  /// Most recent snapshot, or null before the first cycle.
  [[nodiscard]] SnapshotPtr getLastSnapshot() const;

  /// Completed cycles since construction.
  [[nodiscard]] std::uint64_t cycleCount() const noexcept { return cycles_.load(); }

  /// Timer ticks skipped because a cycle was in flight.
  [[nodiscard]] std::uint64_t skippedCount() const noexcept { return skipped_.load(); }

private:
  SnapshotPtr runCycle(); // requires cycleMtx_
  void notify(const SnapshotPtr& snap);
  void timerLoop(std::stop_token st, std::uint32_t intervalMs);

  AdapterSet adapters_;
  MonitorSettings& settings_;
  helpers::clock::ClockFn clock_;

  std::mutex cycleMtx_;
  mutable std::mutex cacheMtx_;
  SnapshotPtr last_{};

  std::vector<SnapshotObserver> snapshotObservers_;
  std::vector<ReadingsObserver> readingsObservers_;

  std::mutex timerMtx_;
  std::condition_variable_any timerCv_;
  std::jthread thread_{};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> cycles_{0};
  std::atomic<std::uint64_t> skipped_{0};
};

} // namespace snapshot
} // namespace cascade

#endif // CASCADE_SNAPSHOT_SNAPSHOT_COMPOSER_HPP
