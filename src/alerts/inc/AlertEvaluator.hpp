#ifndef CASCADE_ALERTS_ALERT_EVALUATOR_HPP
#define CASCADE_ALERTS_ALERT_EVALUATOR_HPP
/**
 * @file AlertEvaluator.hpp
 * @brief Threshold rule engine with cooldown, event history and actions.
 *
 * evaluate() walks every reading against every enabled rule whose pattern
 * matches the reading's canonical path. A rule fires when its condition
 * holds and either it never fired or `now >= lastTriggered + cooldown*1000`.
 *
 * Firing is decided and recorded under the evaluator mutex, so the cooldown
 * check and update are atomic across concurrent evaluate() calls. Alert
 * observers run on the evaluating thread after the lock is released.
 *
 * Actions are queued to an owned worker thread and run there in firing order,
 * so a slow webhook or command never stalls evaluate() or its caller. One
 * failing action never prevents the next. The queue is bounded; fires past
 * the bound are logged and their actions dropped.
 *
 * Every rule mutation is persisted through the AlertRepository. A failed save
 * is logged and the in-memory state is kept.
 */

#include "src/alerts/inc/ActionRunner.hpp"
#include "src/alerts/inc/Alert.hpp"
#include "src/alerts/inc/AlertRepository.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/snapshot/inc/SensorReading.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <stop_token>
#include <string_view>
#include <thread>
#include <vector>

#include <json/json.h>

namespace cascade {
namespace alerts {

inline constexpr std::size_t DEFAULT_EVENT_HISTORY_CAP = 1000;
inline constexpr std::size_t DEFAULT_EVENT_QUERY_LIMIT = 100;
inline constexpr std::size_t DEFAULT_ACTION_QUEUE_CAP = 256;

class AlertEvaluator {
public:
  using AlertObserver = std::function<void(const AlertEvent&)>;

  AlertEvaluator(AlertRepository repository, std::shared_ptr<ActionRunner> runner,
                 helpers::clock::ClockFn clock = helpers::clock::systemClock(),
                 std::size_t historyCap = DEFAULT_EVENT_HISTORY_CAP);
  ~AlertEvaluator();

  AlertEvaluator(const AlertEvaluator&) = delete;
  AlertEvaluator& operator=(const AlertEvaluator&) = delete;

  /// Replace the rule set with the repository contents.
  [[nodiscard]] bool load(std::string* error = nullptr);

  /// Register an observer for fired events. Call before evaluation starts.
  void onAlert(AlertObserver observer);

  /// Global switch; while disabled evaluate() does nothing.
  void setEnabled(bool enabled);
  [[nodiscard]] bool enabled() const;

  /// Check all readings; returns the events fired by this call.
  std::vector<AlertEvent> evaluate(const snapshot::ReadingList& readings);

  /* ----------------------------- Actions ----------------------------- */

  /// Block until every queued action has run.
  void waitForActions();

  /**
   * @brief Join the action worker.
   * @note The in-flight action finishes; queued ones are dropped with a warning.
   *       A later fire starts a new worker.
   */
  void stopActions();

  [[nodiscard]] std::size_t pendingActions() const;

  /* ----------------------------- Rules ----------------------------- */

  /// Create from a document; id and trigger state are assigned here.
  [[nodiscard]] std::optional<Alert> create(const Json::Value& draft,
                                            std::string* error = nullptr);
  [[nodiscard]] std::optional<Alert> create(Alert draft, std::string* error = nullptr);

  /// Merge a partial document; id is immutable.
  [[nodiscard]] std::optional<Alert> update(std::string_view id, const Json::Value& patch,
                                            std::string* error = nullptr);

  bool remove(std::string_view id);
  bool enable(std::string_view id);
  bool disable(std::string_view id);

  [[nodiscard]] std::optional<Alert> get(std::string_view id) const;
  [[nodiscard]] std::vector<Alert> list() const;

  /* ----------------------------- Events ----------------------------- */

  /// Most recent `limit` events, oldest first.
  [[nodiscard]] std::vector<AlertEvent> history(std::size_t limit = DEFAULT_EVENT_QUERY_LIMIT) const;
  bool acknowledge(std::string_view eventId);
  void clearHistory();

private:
  struct Fired {
    AlertEvent event;
    std::vector<AlertAction> actions;
    snapshot::SensorReading reading;
  };

  Alert* findLocked(std::string_view id);
  const Alert* findLocked(std::string_view id) const;
  bool setEnabledLocked(std::string_view id, bool enabled);
  void persistLocked();
  void notifyObservers(const AlertEvent& event);
  void enqueueActions(Fired fired);
  void actionLoop(const std::stop_token& stop);
  void runActions(const Fired& fired);

  AlertRepository repository_;
  std::shared_ptr<ActionRunner> runner_;
  helpers::clock::ClockFn clock_;
  std::size_t historyCap_;

  mutable std::mutex mtx_;
  bool enabled_{true};
  std::vector<Alert> alerts_;
  std::deque<AlertEvent> events_;
  std::vector<AlertObserver> observers_;

  mutable std::mutex actionMtx_;
  std::condition_variable_any actionCv_;
  std::condition_variable actionIdleCv_;
  std::deque<Fired> actionQueue_;
  bool actionBusy_{false};
  std::jthread actionWorker_;
};

} // namespace alerts
} // namespace cascade

#endif // CASCADE_ALERTS_ALERT_EVALUATOR_HPP
