#ifndef CASCADE_SERVICE_TELEMETRY_SERVICE_HPP
#define CASCADE_SERVICE_TELEMETRY_SERVICE_HPP
/**
 * @file TelemetryService.hpp
 * @brief Explicit wiring of every pipeline stage.
 *
 * Data flow per poll cycle (on the composer thread):
 *   composer -> history ingest (enableHistory) -> alert evaluation
 *   -> hub "snapshot" and "readings" channels.
 * Fired alerts go to the hub "alerts" channel. A second timer merges the
 * unified sensors every unifiedInterval and pushes them to "unified".
 *
 * The service owns its components; nothing is process-global.
 */

#include "src/alerts/inc/ActionRunner.hpp"
#include "src/alerts/inc/AlertEvaluator.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/history/inc/HistoryStore.hpp"
#include "src/hub/inc/DistributionHub.hpp"
#include "src/service/inc/MonitorConfig.hpp"
#include "src/snapshot/inc/CategoryAdapter.hpp"
#include "src/snapshot/inc/MonitorSettings.hpp"
#include "src/snapshot/inc/SnapshotComposer.hpp"
#include "src/unified/inc/PluginRegistry.hpp"
#include "src/unified/inc/UnifiedNormalizer.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <json/json.h>

namespace cascade {
namespace service {

class TelemetryService {
public:
  /**
   * Alert rules are loaded from config.alertsPath here.
   *
   * @param config  Validated configuration.
   * @param adapters Category adapters for the composer.
   * @param runner  Alert action runner; null selects DefaultActionRunner.
   * @param clock   Epoch-ms time source shared by every stage.
   */
  TelemetryService(MonitorConfig config, snapshot::AdapterSet adapters,
                   std::shared_ptr<alerts::ActionRunner> runner = nullptr,
                   helpers::clock::ClockFn clock = helpers::clock::systemClock());
  ~TelemetryService();

  TelemetryService(const TelemetryService&) = delete;
  TelemetryService& operator=(const TelemetryService&) = delete;

  /// Add a normalization source. Call before start(). The plugin registry is always added.
  void addUnifiedSource(std::shared_ptr<unified::NormalizationSource> source);

  /// Start plugins and both timers. Idempotent.
  void start();

  /// Stop timers, plugins and the alert action worker. Idempotent.
  /// Subscribers are closed even when start() never ran.
  void stop();

  [[nodiscard]] bool running() const noexcept { return running_.load(); }

  /* ----------------------------- Components ----------------------------- */

  [[nodiscard]] snapshot::SnapshotComposer& composer() noexcept { return composer_; }
  [[nodiscard]] snapshot::MonitorSettings& settings() noexcept { return settings_; }
  [[nodiscard]] history::HistoryStore& historyStore() noexcept { return history_; }
  [[nodiscard]] alerts::AlertEvaluator& alertEvaluator() noexcept { return alerts_; }
  [[nodiscard]] unified::UnifiedNormalizer& normalizer() noexcept { return normalizer_; }
  [[nodiscard]] unified::PluginRegistry& plugins() noexcept { return *plugins_; }
  [[nodiscard]] hub::DistributionHub& hub() noexcept { return hub_; }

  /* ----------------------------- Config ----------------------------- */

  [[nodiscard]] MonitorConfig config() const;

  /**
   * @brief Merge a partial config document and apply it.
   *
   * Enabled categories, history retention, the alert switch and hub auth
   * take effect immediately; intervals apply on the next start().
   */
  [[nodiscard]] bool updateConfig(const Json::Value& patch, std::string* error = nullptr);

  /* ----------------------------- Queries ----------------------------- */

  /// Cached snapshot, or a forced poll when none exists yet.
  [[nodiscard]] snapshot::SnapshotPtr currentSnapshot();

  /// Readings of the current snapshot.
  [[nodiscard]] snapshot::ReadingList currentReadings();

  [[nodiscard]] std::vector<history::HistoryEntry> queryHistory(const history::HistoryQuery& q = {});
  [[nodiscard]] std::vector<history::SeriesPoint>
  sensorHistory(const std::string& path,
                std::int64_t durationMs = history::DEFAULT_SENSOR_WINDOW_MS);
  [[nodiscard]] std::map<std::string, double> latestReadings();

  /// Last unified merge, or a fresh one.
  [[nodiscard]] unified::UnifiedData unifiedSensors();

  /// Resolver answering hub `get` requests from this service.
  [[nodiscard]] std::shared_ptr<hub::ResourceResolver> resolver() { return resolver_; }

private:
  void onCycle(const snapshot::SnapshotPtr& snap, const snapshot::ReadingList& readings);
  void unifiedLoop(std::stop_token st, std::uint32_t intervalMs);
  void pushUnified();

  helpers::clock::ClockFn clock_;

  mutable std::mutex configMtx_;
  MonitorConfig config_;

  snapshot::MonitorSettings settings_;
  snapshot::SnapshotComposer composer_;
  history::HistoryStore history_;
  alerts::AlertEvaluator alerts_;
  std::shared_ptr<unified::PluginRegistry> plugins_;
  unified::UnifiedNormalizer normalizer_;
  hub::DistributionHub hub_;
  std::shared_ptr<hub::ResourceResolver> resolver_;

  std::atomic<bool> running_{false};
  std::atomic<bool> historyEnabled_{true};
  std::mutex lifecycleMtx_;
  std::mutex unifiedMtx_;
  std::condition_variable_any unifiedCv_;
  std::jthread unifiedThread_{};
};

} // namespace service
} // namespace cascade

#endif // CASCADE_SERVICE_TELEMETRY_SERVICE_HPP
