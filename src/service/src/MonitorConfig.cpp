/**
 * @file MonitorConfig.cpp
 */

#include "src/service/inc/MonitorConfig.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Json.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/snapshot/inc/MonitorSettings.hpp"

#include <utility>

#include <fmt/format.h>

namespace cascade {
namespace service {

namespace {

constexpr const char* LOG_CAT = "config";

void setError(std::string* error, std::string msg) {
  if (error != nullptr) {
    *error = std::move(msg);
  }
}

bool present(const Json::Value& doc, const char* key) {
  return doc.isMember(key) && !doc[key].isNull();
}

bool readBool(const Json::Value& doc, const char* key, bool& out, std::string* error) {
  if (!present(doc, key)) {
    return true;
  }
  if (!doc[key].isBool()) {
    setError(error, fmt::format("'{}' must be a boolean", key));
    return false;
  }
  out = doc[key].asBool();
  return true;
}

bool readString(const Json::Value& doc, const char* key, std::string& out, std::string* error) {
  if (!present(doc, key)) {
    return true;
  }
  if (!doc[key].isString()) {
    setError(error, fmt::format("'{}' must be a string", key));
    return false;
  }
  out = doc[key].asString();
  return true;
}

/// Integral field (an integral double is accepted); ranges are checked by validate().
bool readInt(const Json::Value& doc, const char* key, std::int64_t& out, std::string* error) {
  if (!present(doc, key)) {
    return true;
  }
  if (!doc[key].isInt64()) {
    setError(error, fmt::format("'{}' must be an integer", key));
    return false;
  }
  out = doc[key].asInt64();
  return true;
}

} // namespace

bool validate(const MonitorConfig& config, std::string* error) {
  if (config.pollingInterval < MIN_POLLING_INTERVAL_MS ||
      config.pollingInterval > MAX_POLLING_INTERVAL_MS) {
    setError(error, fmt::format("pollingInterval must be {}..{} ms", MIN_POLLING_INTERVAL_MS,
                                MAX_POLLING_INTERVAL_MS));
    return false;
  }
  if (config.historyRetention < MIN_HISTORY_RETENTION_S ||
      config.historyRetention > MAX_HISTORY_RETENTION_S) {
    setError(error, fmt::format("historyRetention must be {}..{} s", MIN_HISTORY_RETENTION_S,
                                MAX_HISTORY_RETENTION_S));
    return false;
  }
  if (config.unifiedInterval < MIN_UNIFIED_INTERVAL_MS ||
      config.unifiedInterval > MAX_UNIFIED_INTERVAL_MS) {
    setError(error, fmt::format("unifiedInterval must be {}..{} ms", MIN_UNIFIED_INTERVAL_MS,
                                MAX_UNIFIED_INTERVAL_MS));
    return false;
  }
  if (config.wsPort < MIN_PORT) {
    setError(error, fmt::format("wsPort must be {}..{}", MIN_PORT, MAX_PORT));
    return false;
  }
  if (config.bindAddress.empty()) {
    setError(error, "bindAddress must not be empty");
    return false;
  }
  if (config.enableAuth && config.apiKey.empty()) {
    setError(error, "enableAuth requires a non-empty apiKey");
    return false;
  }
  std::string bad;
  if (!snapshot::EnabledSet::fromNames(config.enabledSensors, &bad)) {
    setError(error, fmt::format("unknown sensor category '{}'", bad));
    return false;
  }
  return true;
}

Json::Value toJson(const MonitorConfig& config) {
  Json::Value v(Json::objectValue);
  v["pollingInterval"] = config.pollingInterval;
  Json::Value sensors(Json::arrayValue);
  for (const std::string& S : config.enabledSensors) {
    sensors.append(S);
  }
  v["enabledSensors"] = sensors;
  v["enableAuth"] = config.enableAuth;
  v["apiKey"] = config.apiKey;
  v["enableHistory"] = config.enableHistory;
  v["historyRetention"] = static_cast<Json::Int64>(config.historyRetention);
  v["enableAlerts"] = config.enableAlerts;
  v["wsPort"] = config.wsPort;
  v["bindAddress"] = config.bindAddress;
  v["alertsPath"] = config.alertsPath;
  v["unifiedInterval"] = config.unifiedInterval;
  return v;
}

bool applyJson(const Json::Value& doc, MonitorConfig& config, std::string* error) {
  if (!doc.isObject()) {
    setError(error, "config must be a JSON object");
    return false;
  }
  MonitorConfig c = config;

  std::int64_t polling = c.pollingInterval;
  std::int64_t unifiedMs = c.unifiedInterval;
  std::int64_t port = c.wsPort;
  if (!readInt(doc, "pollingInterval", polling, error) ||
      !readInt(doc, "historyRetention", c.historyRetention, error) ||
      !readInt(doc, "unifiedInterval", unifiedMs, error) ||
      !readInt(doc, "wsPort", port, error) || !readBool(doc, "enableAuth", c.enableAuth, error) ||
      !readBool(doc, "enableHistory", c.enableHistory, error) ||
      !readBool(doc, "enableAlerts", c.enableAlerts, error) ||
      !readString(doc, "apiKey", c.apiKey, error) ||
      !readString(doc, "bindAddress", c.bindAddress, error) ||
      !readString(doc, "alertsPath", c.alertsPath, error)) {
    return false;
  }
  // Out-of-range integers are clamped to a value validate() rejects.
  if (polling < 0 || polling > MAX_POLLING_INTERVAL_MS) {
    polling = MAX_POLLING_INTERVAL_MS + 1;
  }
  if (unifiedMs < 0 || unifiedMs > MAX_UNIFIED_INTERVAL_MS) {
    unifiedMs = MAX_UNIFIED_INTERVAL_MS + 1;
  }
  if (port < static_cast<std::int64_t>(MIN_PORT) || port > static_cast<std::int64_t>(MAX_PORT)) {
    setError(error, fmt::format("wsPort must be {}..{}", MIN_PORT, MAX_PORT));
    return false;
  }
  c.pollingInterval = static_cast<std::uint32_t>(polling);
  c.unifiedInterval = static_cast<std::uint32_t>(unifiedMs);
  c.wsPort = static_cast<std::uint16_t>(port);

  if (present(doc, "enabledSensors")) {
    const Json::Value& ARR = doc["enabledSensors"];
    if (!ARR.isArray()) {
      setError(error, "'enabledSensors' must be an array");
      return false;
    }
    std::vector<std::string> names;
    for (const Json::Value& N : ARR) {
      if (!N.isString()) {
        setError(error, "'enabledSensors' entries must be strings");
        return false;
      }
      names.push_back(N.asString());
    }
    c.enabledSensors = std::move(names);
  }

  config = std::move(c);
  return true;
}

MonitorConfig loadConfig(const std::filesystem::path& path) {
  const MonitorConfig DEFAULTS{};
  if (!helpers::files::pathExists(path)) {
    std::string err;
    if (saveConfig(path, DEFAULTS, &err)) {
      helpers::log::info(LOG_CAT, "wrote default config to {}", path.string());
    } else {
      helpers::log::warn(LOG_CAT, "cannot write default config to {}: {}", path.string(), err);
    }
    return DEFAULTS;
  }

  Json::Value doc;
  std::string err;
  MonitorConfig loaded{};
  if (!helpers::json::loadFile(path, doc, &err) || !applyJson(doc, loaded, &err) ||
      !validate(loaded, &err)) {
    helpers::log::warn(LOG_CAT, "{}: {}; using defaults", path.string(), err);
    return DEFAULTS;
  }
  helpers::log::info(LOG_CAT, "loaded {}", path.string());
  return loaded;
}

bool saveConfig(const std::filesystem::path& path, const MonitorConfig& config,
                std::string* error) {
  if (!validate(config, error)) {
    return false;
  }
  return helpers::json::saveFile(path, toJson(config), error);
}

bool updateConfig(MonitorConfig& config, const Json::Value& patch, std::string* error) {
  MonitorConfig candidate = config;
  if (!applyJson(patch, candidate, error) || !validate(candidate, error)) {
    return false;
  }
  config = std::move(candidate);
  return true;
}

} // namespace service
} // namespace cascade
