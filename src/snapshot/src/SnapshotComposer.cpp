/**
 * @file SnapshotComposer.cpp
 * @brief Fan-out/fan-in collection cycle and its timer.
 */

#include "src/snapshot/inc/SnapshotComposer.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/snapshot/inc/ReadingExtractor.hpp"

#include <algorithm> // std::max
#include <chrono>
#include <exception>
#include <future>
#include <optional>
#include <utility>

namespace cascade {
namespace snapshot {

namespace {

constexpr const char* LOG_CAT = "composer";

template <typename Payload>
using PendingPull = std::future<std::optional<Payload>>;

/// Launch adapter->collect() on its own thread; invalid future if disabled.
template <typename Payload>
PendingPull<Payload> launch(CategoryAdapter<Payload>* adapter, bool enabled) {
  if (!enabled || adapter == nullptr) {
    return {};
  }
  return std::async(std::launch::async, [adapter]() -> std::optional<Payload> {
    try {
      return adapter->collect();
    } catch (const std::exception& e) {
      helpers::log::warn(LOG_CAT, "adapter '{}' threw: {}", adapter->name(), e.what());
      return std::nullopt;
    }
  });
}

/// Join a pull; nullopt for disabled or failed categories.
template <typename Payload>
std::optional<Payload> settle(PendingPull<Payload>& pending, Category category) {
  if (!pending.valid()) {
    return std::nullopt;
  }
  std::optional<Payload> result = pending.get();
  if (!result) {
    helpers::log::warn(LOG_CAT, "{} collection failed; using defaults", toString(category));
  }
  return result;
}

} // namespace

/* ----------------------------- Lifecycle ----------------------------- */

SnapshotComposer::SnapshotComposer(AdapterSet adapters, MonitorSettings& settings,
                                   helpers::clock::ClockFn clock)
    : adapters_(std::move(adapters)), settings_(settings), clock_(std::move(clock)) {}

SnapshotComposer::~SnapshotComposer() { stop(); }

void SnapshotComposer::onSnapshot(SnapshotObserver observer) {
  snapshotObservers_.push_back(std::move(observer));
}

void SnapshotComposer::onReadings(ReadingsObserver observer) {
  readingsObservers_.push_back(std::move(observer));
}

void SnapshotComposer::start(std::uint32_t intervalMs) {
  if (running_.exchange(true)) {
    helpers::log::warn(LOG_CAT, "start() ignored: already running");
    return;
  }
  const std::uint32_t INTERVAL = std::max(intervalMs, MIN_POLL_INTERVAL_MS);
  helpers::log::info(LOG_CAT, "polling every {} ms", INTERVAL);
  thread_ = std::jthread([this, INTERVAL](std::stop_token st) { timerLoop(st, INTERVAL); });
}

void SnapshotComposer::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    timerCv_.notify_all();
    thread_.join();
  }
  if (running_.exchange(false)) {
    helpers::log::info(LOG_CAT, "stopped after {} cycles ({} ticks skipped)", cycles_.load(),
                       skipped_.load());
  }
}

void SnapshotComposer::timerLoop(std::stop_token st, std::uint32_t intervalMs) {
  while (!st.stop_requested()) {
    (void)tryPoll();

    std::unique_lock<std::mutex> lock(timerMtx_);
    timerCv_.wait_for(lock, st, std::chrono::milliseconds(intervalMs), [] { return false; });
  }
}

/* ----------------------------- Polling ----------------------------- */

SnapshotPtr SnapshotComposer::poll() {
  std::lock_guard<std::mutex> lock(cycleMtx_);
  return runCycle();
}

SnapshotPtr SnapshotComposer::tryPoll() {
  std::unique_lock<std::mutex> lock(cycleMtx_, std::try_to_lock);
  if (!lock.owns_lock()) {
    skipped_.fetch_add(1);
    helpers::log::debug(LOG_CAT, "tick skipped: cycle in flight");
    return nullptr;
  }
  return runCycle();
}

SnapshotPtr SnapshotComposer::getLastSnapshot() const {
  std::lock_guard<std::mutex> lock(cacheMtx_);
  return last_;
}

SnapshotPtr SnapshotComposer::runCycle() {
  const EnabledSet ENABLED = settings_.enabled();

  auto cpu = launch(adapters_.cpu.get(), ENABLED.test(Category::Cpu));
  auto gpu = launch(adapters_.gpu.get(), ENABLED.test(Category::Gpu));
  auto memory = launch(adapters_.memory.get(), ENABLED.test(Category::Memory));
  auto disk = launch(adapters_.disk.get(), ENABLED.test(Category::Disk));
  auto network = launch(adapters_.network.get(), ENABLED.test(Category::Network));

  auto snap = std::make_shared<Snapshot>();

  if (std::optional<CpuData> c = settle(cpu, Category::Cpu)) {
    snap->cpu = std::move(*c);
    snap->cpu.present = true;
  }
  if (std::optional<std::vector<GpuData>> g = settle(gpu, Category::Gpu)) {
    snap->gpus = std::move(*g);
    for (std::size_t i = 0; i < snap->gpus.size(); ++i) {
      snap->gpus[i].index = static_cast<std::uint32_t>(i);
    }
  }
  if (std::optional<MemoryData> m = settle(memory, Category::Memory)) {
    snap->memory = std::move(*m);
    snap->memory.present = true;
  }
  if (std::optional<std::vector<DiskData>> d = settle(disk, Category::Disk)) {
    snap->disks = std::move(*d);
    for (std::size_t i = 0; i < snap->disks.size(); ++i) {
      snap->disks[i].index = static_cast<std::uint32_t>(i);
    }
  }
  if (std::optional<std::vector<NetworkData>> n = settle(network, Category::Network)) {
    snap->network = std::move(*n);
  }

  SnapshotPtr published;
  {
    std::lock_guard<std::mutex> lock(cacheMtx_);
    const std::int64_t PREV = last_ ? last_->timestamp : 0;
    snap->timestamp = std::max(clock_(), PREV);
    published = snap;
    last_ = published;
  }

  cycles_.fetch_add(1);
  notify(published);
  return published;
}

void SnapshotComposer::notify(const SnapshotPtr& snap) {
  for (const SnapshotObserver& OBS : snapshotObservers_) {
    try {
      OBS(snap);
    } catch (const std::exception& e) {
      helpers::log::error(LOG_CAT, "snapshot observer threw: {}", e.what());
    }
  }

  if (readingsObservers_.empty()) {
    return;
  }
  const ReadingList READINGS = extractReadings(*snap);
  for (const ReadingsObserver& OBS : readingsObservers_) {
    try {
      OBS(snap, READINGS);
    } catch (const std::exception& e) {
      helpers::log::error(LOG_CAT, "readings observer threw: {}", e.what());
    }
  }
}

} // namespace snapshot
} // namespace cascade
