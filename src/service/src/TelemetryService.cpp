/**
 * @file TelemetryService.cpp
 * @brief Stage wiring, unified timer and the hub resource resolver.
 */

#include "src/service/inc/TelemetryService.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/hub/inc/Protocol.hpp"
#include "src/snapshot/inc/ReadingExtractor.hpp"
#include "src/snapshot/inc/SnapshotJson.hpp"

#include <chrono>
#include <exception>
#include <utility>

namespace cascade {
namespace service {

namespace {

constexpr const char* LOG_CAT = "service";

snapshot::EnabledSet enabledFrom(const MonitorConfig& config) {
  return snapshot::EnabledSet::fromNames(config.enabledSensors).value_or(snapshot::EnabledSet{});
}

hub::HubOptions hubOptionsFrom(const MonitorConfig& config) {
  hub::HubOptions o{};
  o.enableAuth = config.enableAuth;
  o.apiKey = config.apiKey;
  return o;
}

/* ----------------------------- Resolver ----------------------------- */

/// Maps `get{resource}` names onto service queries.
class ServiceResolver final : public hub::ResourceResolver {
public:
  explicit ServiceResolver(TelemetryService& service) : service_(service) {}

  std::optional<Json::Value> resolve(std::string_view resource) override {
    if (resource == "snapshot") {
      return snapshot::toJson(*service_.currentSnapshot());
    }
    if (resource == "cpu") {
      return snapshot::toJson(service_.currentSnapshot()->cpu);
    }
    if (resource == "gpu") {
      return snapshot::gpusToJson(service_.currentSnapshot()->gpus);
    }
    if (resource == "memory") {
      return snapshot::toJson(service_.currentSnapshot()->memory);
    }
    if (resource == "disks") {
      return snapshot::disksToJson(service_.currentSnapshot()->disks);
    }
    if (resource == "network") {
      return snapshot::networkToJson(service_.currentSnapshot()->network);
    }
    if (resource == "sensors") {
      return snapshot::toJson(service_.currentReadings());
    }
    if (resource == "alerts") {
      Json::Value arr(Json::arrayValue);
      for (const alerts::Alert& A : service_.alertEvaluator().list()) {
        arr.append(alerts::toJson(A));
      }
      return arr;
    }
    if (resource == "alertHistory") {
      Json::Value arr(Json::arrayValue);
      for (const alerts::AlertEvent& E : service_.alertEvaluator().history()) {
        arr.append(alerts::toJson(E));
      }
      return arr;
    }
    if (resource == "history") {
      return history::toJson(service_.queryHistory());
    }
    if (resource == "unified") {
      return unified::toJson(service_.unifiedSensors());
    }
    return std::nullopt;
  }

private:
  TelemetryService& service_;
};

} // namespace

/* ----------------------------- Construction ----------------------------- */

TelemetryService::TelemetryService(MonitorConfig config, snapshot::AdapterSet adapters,
                                   std::shared_ptr<alerts::ActionRunner> runner,
                                   helpers::clock::ClockFn clock)
    : clock_(std::move(clock)), config_(std::move(config)), settings_(enabledFrom(config_)),
      composer_(std::move(adapters), settings_, clock_),
      history_(config_.historyRetention * 1000, clock_),
      alerts_(alerts::AlertRepository(config_.alertsPath),
              runner ? std::move(runner) : std::make_shared<alerts::DefaultActionRunner>(),
              clock_),
      plugins_(std::make_shared<unified::PluginRegistry>()), normalizer_(clock_),
      hub_(hubOptionsFrom(config_), clock_) {
  historyEnabled_.store(config_.enableHistory);
  alerts_.setEnabled(config_.enableAlerts);

  std::string err;
  if (!alerts_.load(&err)) {
    helpers::log::error(LOG_CAT, "cannot load alerts from {}: {}", config_.alertsPath, err);
  }

  composer_.onReadings([this](const snapshot::SnapshotPtr& snap,
                              const snapshot::ReadingList& readings) { onCycle(snap, readings); });
  alerts_.onAlert([this](const alerts::AlertEvent& event) {
    hub_.channel(hub::CHANNEL_ALERTS).push(alerts::toJson(event));
  });

  normalizer_.addSource(plugins_);
  resolver_ = std::make_shared<ServiceResolver>(*this);
  hub_.setResolver(resolver_);
}

TelemetryService::~TelemetryService() {
  stop();
  composer_.stop();
}

void TelemetryService::addUnifiedSource(std::shared_ptr<unified::NormalizationSource> source) {
  normalizer_.addSource(std::move(source));
}

/* ----------------------------- Lifecycle ----------------------------- */

void TelemetryService::start() {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  if (running_.load()) {
    return;
  }
  const MonitorConfig CFG = config();

  plugins_->initAll();
  plugins_->startAll();

  composer_.start(CFG.pollingInterval);
  const std::uint32_t UNIFIED_MS = CFG.unifiedInterval;
  unifiedThread_ =
      std::jthread([this, UNIFIED_MS](std::stop_token st) { unifiedLoop(st, UNIFIED_MS); });

  running_.store(true);
  helpers::log::info(LOG_CAT, "started (poll {} ms, unified {} ms, {} unified source(s))",
                     CFG.pollingInterval, UNIFIED_MS, normalizer_.sourceCount());
}

void TelemetryService::stop() {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  if (running_.exchange(false)) {
    composer_.stop();
    if (unifiedThread_.joinable()) {
      unifiedThread_.request_stop();
      unifiedCv_.notify_all();
      unifiedThread_.join();
    }
    plugins_->stopAll();
    helpers::log::info(LOG_CAT, "stopped");
  }
  // Both are idempotent and apply even when start() never ran.
  alerts_.stopActions();
  hub_.closeAll();
}

void TelemetryService::onCycle(const snapshot::SnapshotPtr& snap,
                               const snapshot::ReadingList& readings) {
  if (historyEnabled_.load()) {
    history_.ingest(history::toHistoryEntry(readings, snap->timestamp));
  }
  (void)alerts_.evaluate(readings);

  hub_.channel(hub::CHANNEL_SNAPSHOT).push(snapshot::toJson(*snap));
  hub_.channel(hub::CHANNEL_READINGS).push(snapshot::toJson(readings));
}

void TelemetryService::unifiedLoop(std::stop_token st, std::uint32_t intervalMs) {
  while (!st.stop_requested()) {
    pushUnified();

    std::unique_lock<std::mutex> lock(unifiedMtx_);
    unifiedCv_.wait_for(lock, st, std::chrono::milliseconds(intervalMs), [] { return false; });
  }
}

void TelemetryService::pushUnified() {
  try {
    const unified::UnifiedData DATA = normalizer_.merge();
    hub_.channel(hub::CHANNEL_UNIFIED).push(unified::toJson(DATA));
  } catch (const std::exception& e) {
    helpers::log::warn(LOG_CAT, "unified merge failed: {}", e.what());
  }
}

/* ----------------------------- Config ----------------------------- */

MonitorConfig TelemetryService::config() const {
  std::lock_guard<std::mutex> lock(configMtx_);
  return config_;
}

bool TelemetryService::updateConfig(const Json::Value& patch, std::string* error) {
  MonitorConfig updated;
  {
    std::lock_guard<std::mutex> lock(configMtx_);
    if (!service::updateConfig(config_, patch, error)) {
      return false;
    }
    updated = config_;
  }
  settings_.replace(enabledFrom(updated));
  history_.setRetention(updated.historyRetention * 1000);
  historyEnabled_.store(updated.enableHistory);
  alerts_.setEnabled(updated.enableAlerts);
  hub_.setOptions(hubOptionsFrom(updated));
  helpers::log::info(LOG_CAT, "configuration updated");
  return true;
}

/* ----------------------------- Queries ----------------------------- */

snapshot::SnapshotPtr TelemetryService::currentSnapshot() {
  snapshot::SnapshotPtr snap = composer_.getLastSnapshot();
  return snap ? snap : composer_.poll();
}

snapshot::ReadingList TelemetryService::currentReadings() {
  return snapshot::extractReadings(*currentSnapshot());
}

std::vector<history::HistoryEntry> TelemetryService::queryHistory(const history::HistoryQuery& q) {
  return history_.query(q);
}

std::vector<history::SeriesPoint> TelemetryService::sensorHistory(const std::string& path,
                                                                  std::int64_t durationMs) {
  return history_.getSensorHistory(path, durationMs);
}

std::map<std::string, double> TelemetryService::latestReadings() {
  return history_.getLatestReadings();
}

unified::UnifiedData TelemetryService::unifiedSensors() {
  std::optional<unified::UnifiedData> last = normalizer_.last();
  return last ? std::move(*last) : normalizer_.merge();
}

} // namespace service
} // namespace cascade
