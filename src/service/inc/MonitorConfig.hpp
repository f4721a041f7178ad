#ifndef CASCADE_SERVICE_MONITOR_CONFIG_HPP
#define CASCADE_SERVICE_MONITOR_CONFIG_HPP
/**
 * @file MonitorConfig.hpp
 * @brief Daemon configuration document and its load/save/update rules.
 *
 * Stored as a JSON object. Fields missing from a document keep their current
 * (or default) values. Ranges:
 *  - pollingInterval   100 .. 60000 ms
 *  - historyRetention  60 .. 2592000 s
 *  - unifiedInterval   1000 .. 300000 ms
 *  - wsPort            1024 .. 65535
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <json/json.h>

namespace cascade {
namespace service {

/* ----------------------------- Limits ----------------------------- */

inline constexpr std::uint32_t MIN_POLLING_INTERVAL_MS = 100;
inline constexpr std::uint32_t MAX_POLLING_INTERVAL_MS = 60'000;
inline constexpr std::int64_t MIN_HISTORY_RETENTION_S = 60;
inline constexpr std::int64_t MAX_HISTORY_RETENTION_S = 2'592'000; ///< 30 days
inline constexpr std::uint32_t MIN_UNIFIED_INTERVAL_MS = 1000;
inline constexpr std::uint32_t MAX_UNIFIED_INTERVAL_MS = 300'000;
inline constexpr std::uint32_t MIN_PORT = 1024;
inline constexpr std::uint32_t MAX_PORT = 65535;

inline constexpr const char* DEFAULT_CONFIG_PATH = "config/cascade.json";

/* ----------------------------- MonitorConfig ----------------------------- */

struct MonitorConfig {
  std::uint32_t pollingInterval{1000}; ///< ms
  std::vector<std::string> enabledSensors{"cpu", "gpu", "memory", "disk", "network"};
  bool enableAuth{false};
  std::string apiKey{};
  bool enableHistory{true};
  std::int64_t historyRetention{3600}; ///< s
  bool enableAlerts{true};
  std::uint16_t wsPort{8086};
  std::string bindAddress{"127.0.0.1"};
  std::string alertsPath{"config/alerts.json"};
  std::uint32_t unifiedInterval{5000}; ///< ms

  bool operator==(const MonitorConfig&) const = default;
};

/// Range and category checks.
[[nodiscard]] bool validate(const MonitorConfig& config, std::string* error = nullptr);

[[nodiscard]] Json::Value toJson(const MonitorConfig& config);

/**
 * @brief Overlay a JSON object onto `config`.
 *
 * Type errors fail without touching `config`. Does not range-check; call
 * validate() afterwards.
 */
[[nodiscard]] bool applyJson(const Json::Value& doc, MonitorConfig& config,
                             std::string* error = nullptr);

/**
 * @brief Load the config file.
 *
 * Missing file: defaults are written to `path` and returned. Unreadable or
 * invalid document: logged at WARN and defaults returned.
 */
[[nodiscard]] MonitorConfig loadConfig(const std::filesystem::path& path);

/// Validate and write atomically; nothing is written when invalid.
[[nodiscard]] bool saveConfig(const std::filesystem::path& path, const MonitorConfig& config,
                              std::string* error = nullptr);

/// Merge a partial document over `config` and re-validate. `config` is unchanged on failure.
[[nodiscard]] bool updateConfig(MonitorConfig& config, const Json::Value& patch,
                                std::string* error = nullptr);

} // namespace service
} // namespace cascade

#endif // CASCADE_SERVICE_MONITOR_CONFIG_HPP
