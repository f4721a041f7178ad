/**
 * @file Alert.cpp
 * @brief Alert rules, validation and documents.
 */

#include "src/alerts/inc/Alert.hpp"
#include "src/helpers/inc/Json.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cmath>
#include <random>
#include <utility>

#include <fmt/format.h>

namespace cascade {
namespace alerts {

namespace {

void setError(std::string* error, std::string msg) {
  if (error != nullptr) {
    *error = std::move(msg);
  }
}

/// Optional numeric field; false if present with the wrong type.
bool readNumber(const Json::Value& doc, const char* key, double& out, std::string* error) {
  if (!doc.isMember(key) || doc[key].isNull()) {
    return true;
  }
  if (!doc[key].isNumeric()) {
    setError(error, fmt::format("field '{}' must be a number", key));
    return false;
  }
  out = doc[key].asDouble();
  return true;
}

bool readString(const Json::Value& doc, const char* key, std::string& out, bool required,
                std::string* error) {
  if (!doc.isMember(key) || doc[key].isNull()) {
    if (required) {
      setError(error, fmt::format("field '{}' is required", key));
      return false;
    }
    return true;
  }
  if (!doc[key].isString()) {
    setError(error, fmt::format("field '{}' must be a string", key));
    return false;
  }
  out = doc[key].asString();
  return true;
}

bool readActions(const Json::Value& doc, std::vector<AlertAction>& out, std::string* error) {
  if (!doc.isMember("actions") || doc["actions"].isNull()) {
    return true;
  }
  const Json::Value& ARR = doc["actions"];
  if (!ARR.isArray()) {
    setError(error, "field 'actions' must be an array");
    return false;
  }
  std::vector<AlertAction> actions;
  for (Json::ArrayIndex i = 0; i < ARR.size(); ++i) {
    const Json::Value& A = ARR[i];
    if (!A.isObject() || !A["type"].isString()) {
      setError(error, fmt::format("action {} needs a string 'type'", i));
      return false;
    }
    AlertAction action{};
    if (!parseActionType(A["type"].asString(), action.type)) {
      setError(error, fmt::format("unknown action type '{}'", A["type"].asString()));
      return false;
    }
    if (A.isMember("config")) {
      if (!A["config"].isObject()) {
        setError(error, fmt::format("action {} config must be an object", i));
        return false;
      }
      action.config = A["config"];
    }
    actions.push_back(std::move(action));
  }
  out = std::move(actions);
  return true;
}

bool hasStringConfig(const AlertAction& action, const char* key) {
  return action.config.isMember(key) && action.config[key].isString() &&
         !action.config[key].asString().empty();
}

} // namespace

/* ----------------------------- Enums ----------------------------- */

const char* toString(Condition condition) noexcept {
  switch (condition) {
  case Condition::Above:
    return "above";
  case Condition::Below:
    return "below";
  case Condition::Between:
    return "between";
  case Condition::Outside:
    return "outside";
  }
  return "above";
}

const char* toString(ActionType type) noexcept {
  switch (type) {
  case ActionType::Notification:
    return "notification";
  case ActionType::Sound:
    return "sound";
  case ActionType::Email:
    return "email";
  case ActionType::Webhook:
    return "webhook";
  case ActionType::Command:
    return "command";
  }
  return "notification";
}

bool parseCondition(std::string_view text, Condition& out) noexcept {
  if (text == "above") {
    out = Condition::Above;
  } else if (text == "below") {
    out = Condition::Below;
  } else if (text == "between") {
    out = Condition::Between;
  } else if (text == "outside") {
    out = Condition::Outside;
  } else {
    return false;
  }
  return true;
}

bool parseActionType(std::string_view text, ActionType& out) noexcept {
  if (text == "notification") {
    out = ActionType::Notification;
  } else if (text == "sound") {
    out = ActionType::Sound;
  } else if (text == "email") {
    out = ActionType::Email;
  } else if (text == "webhook") {
    out = ActionType::Webhook;
  } else if (text == "command") {
    out = ActionType::Command;
  } else {
    return false;
  }
  return true;
}

std::string Alert::toString() const {
  return fmt::format("{} [{} {} {}..{}]", name, sensorPath, alerts::toString(condition),
                     thresholdMin, thresholdMax);
}

/* ----------------------------- Rules ----------------------------- */

bool matchesPath(std::string_view pattern, std::string_view path) noexcept {
  if (pattern == "*") {
    return true;
  }
  if (helpers::strings::endsWith(pattern, "*")) {
    return helpers::strings::startsWith(path, pattern.substr(0, pattern.size() - 1));
  }
  return pattern == path;
}

bool conditionHolds(Condition condition, double value, double min, double max) noexcept {
  switch (condition) {
  case Condition::Above:
    return value > max;
  case Condition::Below:
    return value < min;
  case Condition::Between:
    return value >= min && value <= max;
  case Condition::Outside:
    return value < min || value > max;
  }
  return false;
}

double eventThreshold(const Alert& alert) noexcept {
  return alert.condition == Condition::Below ? alert.thresholdMin : alert.thresholdMax;
}

bool validate(const Alert& alert, std::string* error) {
  if (alert.name.empty()) {
    setError(error, "name must not be empty");
    return false;
  }
  if (alert.sensorPath.empty()) {
    setError(error, "sensorPath must not be empty");
    return false;
  }
  if (!std::isfinite(alert.thresholdMin) || !std::isfinite(alert.thresholdMax)) {
    setError(error, "thresholds must be finite");
    return false;
  }
  if ((alert.condition == Condition::Between || alert.condition == Condition::Outside) &&
      alert.thresholdMin > alert.thresholdMax) {
    setError(error, fmt::format("{} requires thresholdMin <= thresholdMax",
                                toString(alert.condition)));
    return false;
  }
  if (!(alert.cooldown >= 0.0) || !(alert.duration >= 0.0)) {
    setError(error, "cooldown and duration must be >= 0");
    return false;
  }
  if (alert.cooldown > MAX_ALERT_WINDOW_S || alert.duration > MAX_ALERT_WINDOW_S) {
    setError(error, fmt::format("cooldown and duration must be <= {} s", MAX_ALERT_WINDOW_S));
    return false;
  }
  for (const AlertAction& A : alert.actions) {
    if (A.type == ActionType::Webhook && !hasStringConfig(A, "url")) {
      setError(error, "webhook action needs config.url");
      return false;
    }
    if (A.type == ActionType::Command && !hasStringConfig(A, "command")) {
      setError(error, "command action needs config.command");
      return false;
    }
  }
  return true;
}

std::string generateId() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  const std::uint64_t HI = (rng() & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  const std::uint64_t LO = (rng() & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", HI >> 32, (HI >> 16) & 0xFFFF,
                     HI & 0xFFFF, LO >> 48, LO & 0xFFFFFFFFFFFFULL);
}

/* ----------------------------- JSON ----------------------------- */

Json::Value toJson(const AlertAction& action) {
  Json::Value v(Json::objectValue);
  v["type"] = toString(action.type);
  v["config"] = action.config;
  return v;
}

Json::Value toJson(const Alert& alert) {
  Json::Value v(Json::objectValue);
  v["id"] = alert.id;
  v["name"] = alert.name;
  v["enabled"] = alert.enabled;
  v["sensorPath"] = alert.sensorPath;
  v["condition"] = toString(alert.condition);
  v["thresholdMin"] = alert.thresholdMin;
  v["thresholdMax"] = alert.thresholdMax;
  v["duration"] = alert.duration;
  v["cooldown"] = alert.cooldown;
  Json::Value actions(Json::arrayValue);
  for (const AlertAction& A : alert.actions) {
    actions.append(toJson(A));
  }
  v["actions"] = actions;
  v["lastTriggered"] = helpers::json::fromOptional(alert.lastTriggered);
  v["triggerCount"] = static_cast<Json::UInt64>(alert.triggerCount);
  return v;
}

Json::Value toJson(const AlertEvent& event) {
  Json::Value v(Json::objectValue);
  v["id"] = event.id;
  v["alertId"] = event.alertId;
  v["alertName"] = event.alertName;
  v["sensorPath"] = event.sensorPath;
  v["value"] = event.value;
  v["threshold"] = event.threshold;
  v["condition"] = toString(event.condition);
  v["timestamp"] = static_cast<Json::Int64>(event.timestamp);
  v["acknowledged"] = event.acknowledged;
  return v;
}

bool fromJson(const Json::Value& doc, Alert& out, std::string* error) {
  if (!doc.isObject()) {
    setError(error, "alert must be a JSON object");
    return false;
  }
  Alert a{};
  std::string condition;
  if (!readString(doc, "id", a.id, false, error) ||
      !readString(doc, "name", a.name, true, error) ||
      !readString(doc, "sensorPath", a.sensorPath, true, error) ||
      !readString(doc, "condition", condition, true, error)) {
    return false;
  }
  if (!parseCondition(condition, a.condition)) {
    setError(error, fmt::format("unknown condition '{}'", condition));
    return false;
  }
  if (doc.isMember("enabled") && !doc["enabled"].isNull()) {
    if (!doc["enabled"].isBool()) {
      setError(error, "field 'enabled' must be a boolean");
      return false;
    }
    a.enabled = doc["enabled"].asBool();
  }
  if (!readNumber(doc, "thresholdMin", a.thresholdMin, error) ||
      !readNumber(doc, "thresholdMax", a.thresholdMax, error) ||
      !readNumber(doc, "duration", a.duration, error) ||
      !readNumber(doc, "cooldown", a.cooldown, error) || !readActions(doc, a.actions, error)) {
    return false;
  }
  a.lastTriggered = helpers::json::optInt64(doc, "lastTriggered");
  // Counters that are negative, fractional or out of range restart at 0.
  if (doc.isMember("triggerCount") && doc["triggerCount"].isUInt64()) {
    a.triggerCount = doc["triggerCount"].asUInt64();
  }
  out = std::move(a);
  return true;
}

bool applyPatch(const Json::Value& patch, Alert& alert, std::string* error) {
  if (!patch.isObject()) {
    setError(error, "patch must be a JSON object");
    return false;
  }
  Json::Value merged = toJson(alert);
  for (const std::string& KEY : patch.getMemberNames()) {
    if (KEY == "id" || KEY == "lastTriggered" || KEY == "triggerCount") {
      continue;
    }
    merged[KEY] = patch[KEY];
  }
  Alert updated{};
  if (!fromJson(merged, updated, error)) {
    return false;
  }
  updated.id = alert.id;
  updated.lastTriggered = alert.lastTriggered;
  updated.triggerCount = alert.triggerCount;
  alert = std::move(updated);
  return true;
}

} // namespace alerts
} // namespace cascade
