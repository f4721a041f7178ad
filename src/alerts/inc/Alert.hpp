#ifndef CASCADE_ALERTS_ALERT_HPP
#define CASCADE_ALERTS_ALERT_HPP
/**
 * @file Alert.hpp
 * @brief Threshold alert rules, fired events, and their JSON documents.
 *
 * Sensor path patterns:
 *  - "*"        matches every path
 *  - "prefix*"  matches paths starting with prefix
 *  - otherwise  exact match
 *
 * Conditions (min = thresholdMin, max = thresholdMax):
 *  - above:   v >  max
 *  - below:   v <  min
 *  - between: min <= v <= max
 *  - outside: v < min || v > max
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

namespace cascade {
namespace alerts {

/* ----------------------------- Enums ----------------------------- */

enum class Condition : std::uint8_t { Above = 0, Below, Between, Outside };

enum class ActionType : std::uint8_t { Notification = 0, Sound, Email, Webhook, Command };

[[nodiscard]] const char* toString(Condition condition) noexcept;
[[nodiscard]] const char* toString(ActionType type) noexcept;

[[nodiscard]] bool parseCondition(std::string_view text, Condition& out) noexcept;
[[nodiscard]] bool parseActionType(std::string_view text, ActionType& out) noexcept;

/* ----------------------------- Records ----------------------------- */

/// Upper bound for cooldown and duration: one year in seconds.
inline constexpr double MAX_ALERT_WINDOW_S = 31'536'000.0;

struct AlertAction {
  ActionType type{ActionType::Notification};
  Json::Value config{Json::objectValue}; ///< Type-specific settings (url, command, ...)
};

struct Alert {
  std::string id{};
  std::string name{};
  bool enabled{true};
  std::string sensorPath{}; ///< Pattern, see file header
  Condition condition{Condition::Above};
  double thresholdMin{0.0};
  double thresholdMax{0.0};
  double duration{0.0};  ///< Seconds; stored, not enforced
  double cooldown{60.0}; ///< Seconds between firings
  std::vector<AlertAction> actions{};
  std::optional<std::int64_t> lastTriggered{}; ///< Epoch ms
  std::uint64_t triggerCount{0};

  /// "name [path condition min..max]".
  [[nodiscard]] std::string toString() const;
};

struct AlertEvent {
  std::string id{};
  std::string alertId{};
  std::string alertName{};
  std::string sensorPath{}; ///< Matched reading path
  double value{0.0};
  double threshold{0.0}; ///< thresholdMin for below, thresholdMax otherwise
  Condition condition{Condition::Above};
  std::int64_t timestamp{0};
  bool acknowledged{false};
};

/* ----------------------------- Rules ----------------------------- */

[[nodiscard]] bool matchesPath(std::string_view pattern, std::string_view path) noexcept;

/// Condition test for a finite value.
[[nodiscard]] bool conditionHolds(Condition condition, double value, double min,
                                  double max) noexcept;

/// Threshold recorded on an event for this rule.
[[nodiscard]] double eventThreshold(const Alert& alert) noexcept;

/// Shape check applied on create, update and load.
[[nodiscard]] bool validate(const Alert& alert, std::string* error = nullptr);

/// Random RFC 4122 version 4 identifier.
[[nodiscard]] std::string generateId();

/* ----------------------------- JSON ----------------------------- */

[[nodiscard]] Json::Value toJson(const AlertAction& action);
[[nodiscard]] Json::Value toJson(const Alert& alert);
[[nodiscard]] Json::Value toJson(const AlertEvent& event);

/**
 * @brief Read an alert document.
 *
 * Required: name, sensorPath, condition. Other fields fall back to defaults.
 * Does not call validate().
 */
[[nodiscard]] bool fromJson(const Json::Value& doc, Alert& out, std::string* error = nullptr);

/**
 * @brief Overlay a partial document on an alert.
 *
 * id, lastTriggered and triggerCount in the patch are ignored. On failure
 * `alert` is left unchanged.
 */
[[nodiscard]] bool applyPatch(const Json::Value& patch, Alert& alert,
                              std::string* error = nullptr);

} // namespace alerts
} // namespace cascade

#endif // CASCADE_ALERTS_ALERT_HPP
