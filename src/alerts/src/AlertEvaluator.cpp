/**
 * @file AlertEvaluator.cpp
 * @brief Rule evaluation, cooldown bookkeeping and action dispatch.
 */

#include "src/alerts/inc/AlertEvaluator.hpp"
#include "src/helpers/inc/Log.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

namespace cascade {
namespace alerts {

namespace {

constexpr const char* LOG_CAT = "alerts";

void setError(std::string* error, std::string msg) {
  if (error != nullptr) {
    *error = std::move(msg);
  }
}

bool cooldownElapsed(const Alert& alert, std::int64_t now) noexcept {
  if (!alert.lastTriggered) {
    return true;
  }
  // In double: neither the product nor the sum may overflow int64.
  const double ELAPSED_MS = static_cast<double>(now) - static_cast<double>(*alert.lastTriggered);
  return ELAPSED_MS >= alert.cooldown * 1000.0;
}

} // namespace

AlertEvaluator::AlertEvaluator(AlertRepository repository, std::shared_ptr<ActionRunner> runner,
                               helpers::clock::ClockFn clock, std::size_t historyCap)
    : repository_(std::move(repository)), runner_(std::move(runner)), clock_(std::move(clock)),
      historyCap_(historyCap) {}

AlertEvaluator::~AlertEvaluator() { stopActions(); }

bool AlertEvaluator::load(std::string* error) {
  std::vector<Alert> loaded;
  if (!repository_.load(loaded, error)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mtx_);
  alerts_ = std::move(loaded);
  helpers::log::info(LOG_CAT, "loaded {} alert(s)", alerts_.size());
  return true;
}

void AlertEvaluator::onAlert(AlertObserver observer) {
  std::lock_guard<std::mutex> lock(mtx_);
  observers_.push_back(std::move(observer));
}

void AlertEvaluator::setEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mtx_);
  enabled_ = enabled;
}

bool AlertEvaluator::enabled() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return enabled_;
}

/* ----------------------------- Evaluation ----------------------------- */

std::vector<AlertEvent> AlertEvaluator::evaluate(const snapshot::ReadingList& readings) {
  std::vector<Fired> fired;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!enabled_ || alerts_.empty()) {
      return {};
    }
    const std::int64_t NOW = clock_();

    for (const snapshot::SensorReading& R : readings) {
      for (Alert& alert : alerts_) {
        if (!alert.enabled || !matchesPath(alert.sensorPath, R.source)) {
          continue;
        }
        if (!std::isfinite(R.value)) {
          helpers::log::debug(LOG_CAT, "'{}': skipping non-finite value at {}", alert.name,
                              R.source);
          continue;
        }
        if (!conditionHolds(alert.condition, R.value, alert.thresholdMin, alert.thresholdMax) ||
            !cooldownElapsed(alert, NOW)) {
          continue;
        }

        AlertEvent event{};
        event.id = generateId();
        event.alertId = alert.id;
        event.alertName = alert.name;
        event.sensorPath = R.source;
        event.value = R.value;
        event.threshold = eventThreshold(alert);
        event.condition = alert.condition;
        event.timestamp = NOW;

        alert.lastTriggered = NOW;
        ++alert.triggerCount;

        events_.push_back(event);
        while (historyCap_ > 0 && events_.size() > historyCap_) {
          events_.pop_front();
        }
        fired.push_back(Fired{std::move(event), alert.actions, R});
      }
    }
    if (!fired.empty()) {
      persistLocked();
    }
  }

  std::vector<AlertEvent> out;
  out.reserve(fired.size());
  for (const Fired& F : fired) {
    helpers::log::info(LOG_CAT, "'{}' fired: {} = {} ({} {})", F.event.alertName,
                       F.event.sensorPath, F.event.value, toString(F.event.condition),
                       F.event.threshold);
    notifyObservers(F.event);
    out.push_back(F.event);
  }
  for (Fired& f : fired) {
    if (runner_ && !f.actions.empty()) {
      enqueueActions(std::move(f));
    }
  }
  return out;
}

void AlertEvaluator::notifyObservers(const AlertEvent& event) {
  std::vector<AlertObserver> observers;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    observers = observers_;
  }
  for (const AlertObserver& OBS : observers) {
    try {
      OBS(event);
    } catch (const std::exception& e) {
      helpers::log::error(LOG_CAT, "alert observer threw: {}", e.what());
    }
  }
}

/* ----------------------------- Actions ----------------------------- */

void AlertEvaluator::enqueueActions(Fired fired) {
  std::lock_guard<std::mutex> lock(actionMtx_);
  if (actionQueue_.size() >= DEFAULT_ACTION_QUEUE_CAP) {
    helpers::log::warn(LOG_CAT, "'{}': action queue full, dropping {} action(s)",
                       fired.event.alertName, fired.actions.size());
    return;
  }
  actionQueue_.push_back(std::move(fired));
  if (!actionWorker_.joinable()) {
    actionWorker_ = std::jthread([this](std::stop_token st) { actionLoop(st); });
  }
  actionCv_.notify_one();
}

void AlertEvaluator::actionLoop(const std::stop_token& stop) {
  std::unique_lock<std::mutex> lock(actionMtx_);
  while (actionCv_.wait(lock, stop, [this] { return !actionQueue_.empty(); })) {
    if (stop.stop_requested()) {
      helpers::log::warn(LOG_CAT, "stopping with {} queued alert(s); their actions are dropped",
                         actionQueue_.size());
      actionQueue_.clear();
      break;
    }
    Fired job = std::move(actionQueue_.front());
    actionQueue_.pop_front();
    actionBusy_ = true;
    lock.unlock();

    runActions(job);

    lock.lock();
    actionBusy_ = false;
    actionIdleCv_.notify_all();
  }
  actionIdleCv_.notify_all();
}

void AlertEvaluator::runActions(const Fired& fired) {
  for (const AlertAction& A : fired.actions) {
    try {
      std::string err;
      if (!runner_->run(A, fired.event, fired.reading, &err)) {
        helpers::log::error(LOG_CAT, "'{}' {} action failed: {}", fired.event.alertName,
                            toString(A.type), err);
      }
    } catch (const std::exception& e) {
      helpers::log::error(LOG_CAT, "'{}' {} action threw: {}", fired.event.alertName,
                          toString(A.type), e.what());
    }
  }
}

void AlertEvaluator::waitForActions() {
  std::unique_lock<std::mutex> lock(actionMtx_);
  actionIdleCv_.wait(lock, [this] { return actionQueue_.empty() && !actionBusy_; });
}

void AlertEvaluator::stopActions() {
  std::jthread worker;
  {
    std::lock_guard<std::mutex> lock(actionMtx_);
    worker = std::move(actionWorker_);
  }
  if (worker.joinable()) {
    worker.request_stop();
    worker.join();
  }
}

std::size_t AlertEvaluator::pendingActions() const {
  std::lock_guard<std::mutex> lock(actionMtx_);
  return actionQueue_.size() + (actionBusy_ ? 1U : 0U);
}

/* ----------------------------- Rules ----------------------------- */

std::optional<Alert> AlertEvaluator::create(const Json::Value& draft, std::string* error) {
  Alert alert{};
  if (!fromJson(draft, alert, error)) {
    return std::nullopt;
  }
  return create(std::move(alert), error);
}

std::optional<Alert> AlertEvaluator::create(Alert draft, std::string* error) {
  if (!validate(draft, error)) {
    return std::nullopt;
  }
  draft.id = generateId();
  draft.lastTriggered.reset();
  draft.triggerCount = 0;

  std::lock_guard<std::mutex> lock(mtx_);
  alerts_.push_back(draft);
  persistLocked();
  return draft;
}

std::optional<Alert> AlertEvaluator::update(std::string_view id, const Json::Value& patch,
                                            std::string* error) {
  std::lock_guard<std::mutex> lock(mtx_);
  Alert* current = findLocked(id);
  if (current == nullptr) {
    setError(error, "Alert not found");
    return std::nullopt;
  }
  Alert candidate = *current;
  if (!applyPatch(patch, candidate, error) || !validate(candidate, error)) {
    return std::nullopt;
  }
  *current = candidate;
  persistLocked();
  return candidate;
}

bool AlertEvaluator::remove(std::string_view id) {
  std::lock_guard<std::mutex> lock(mtx_);
  const auto IT = std::find_if(alerts_.begin(), alerts_.end(),
                               [id](const Alert& a) { return a.id == id; });
  if (IT == alerts_.end()) {
    return false;
  }
  alerts_.erase(IT);
  persistLocked();
  return true;
}

bool AlertEvaluator::enable(std::string_view id) {
  std::lock_guard<std::mutex> lock(mtx_);
  return setEnabledLocked(id, true);
}

bool AlertEvaluator::disable(std::string_view id) {
  std::lock_guard<std::mutex> lock(mtx_);
  return setEnabledLocked(id, false);
}

std::optional<Alert> AlertEvaluator::get(std::string_view id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  const Alert* a = findLocked(id);
  if (a == nullptr) {
    return std::nullopt;
  }
  return *a;
}

std::vector<Alert> AlertEvaluator::list() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return alerts_;
}

Alert* AlertEvaluator::findLocked(std::string_view id) {
  for (Alert& a : alerts_) {
    if (a.id == id) {
      return &a;
    }
  }
  return nullptr;
}

const Alert* AlertEvaluator::findLocked(std::string_view id) const {
  for (const Alert& A : alerts_) {
    if (A.id == id) {
      return &A;
    }
  }
  return nullptr;
}

bool AlertEvaluator::setEnabledLocked(std::string_view id, bool enabled) {
  Alert* a = findLocked(id);
  if (a == nullptr) {
    return false;
  }
  a->enabled = enabled;
  persistLocked();
  return true;
}

void AlertEvaluator::persistLocked() {
  std::string err;
  if (!repository_.save(alerts_, &err)) {
    helpers::log::error(LOG_CAT, "failed to save alerts: {}", err);
  }
}

/* ----------------------------- Events ----------------------------- */

std::vector<AlertEvent> AlertEvaluator::history(std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mtx_);
  const std::size_t N = std::min(limit, events_.size());
  return std::vector<AlertEvent>(events_.end() - static_cast<std::ptrdiff_t>(N), events_.end());
}

bool AlertEvaluator::acknowledge(std::string_view eventId) {
  std::lock_guard<std::mutex> lock(mtx_);
  for (AlertEvent& e : events_) {
    if (e.id == eventId) {
      e.acknowledged = true;
      return true;
    }
  }
  return false;
}

void AlertEvaluator::clearHistory() {
  std::lock_guard<std::mutex> lock(mtx_);
  events_.clear();
}

} // namespace alerts
} // namespace cascade
