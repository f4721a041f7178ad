#ifndef CASCADE_ALERTS_ACTION_RUNNER_HPP
#define CASCADE_ALERTS_ACTION_RUNNER_HPP
/**
 * @file ActionRunner.hpp
 * @brief Side effects dispatched when an alert fires.
 *
 * DefaultActionRunner behavior per action type:
 *  - notification: desktop notification via notify-send when installed, else a log line
 *  - webhook:      libcurl POST of {"event":..., "reading":...} to config.url (http or https)
 *  - command:      config.command run through /bin/sh -c, killed at the deadline
 *  - sound:        terminal bell on stderr
 *  - email:        log line only; no SMTP transport is configured
 */

#include "src/alerts/inc/Alert.hpp"
#include "src/snapshot/inc/SensorReading.hpp"

#include <string>

namespace cascade {
namespace alerts {

/* ----------------------------- Interface ----------------------------- */

class ActionRunner {
public:
  virtual ~ActionRunner() = default;

  /// Perform one action. Returns false (with error) on failure; may throw.
  [[nodiscard]] virtual bool run(const AlertAction& action, const AlertEvent& event,
                                 const snapshot::SensorReading& reading,
                                 std::string* error) = 0;
};

/* ----------------------------- HTTP ----------------------------- */

inline constexpr int DEFAULT_WEBHOOK_TIMEOUT_MS = 5000;
inline constexpr int DEFAULT_COMMAND_TIMEOUT_MS = 30000;

/**
 * @brief POST a JSON body with libcurl and read the response status.
 * @param url http:// or https:// URL; other schemes fail without a transfer.
 * @param status Receives the HTTP status code when a response was read.
 * @return true for a 2xx response.
 */
[[nodiscard]] bool httpPostJson(const std::string& url, const std::string& body, int timeoutMs,
                                long* status = nullptr, std::string* error = nullptr);

/**
 * @brief Run command through /bin/sh -c and wait up to timeoutMs.
 * @return Exit status, or -1 if it could not run, was signalled or timed out.
 * @note On timeout the whole process group of the shell is killed.
 */
[[nodiscard]] int runShell(const std::string& command, int timeoutMs,
                           std::string* error = nullptr);

/* ----------------------------- DefaultActionRunner ----------------------------- */

class DefaultActionRunner final : public ActionRunner {
public:
  explicit DefaultActionRunner(int webhookTimeoutMs = DEFAULT_WEBHOOK_TIMEOUT_MS,
                               int commandTimeoutMs = DEFAULT_COMMAND_TIMEOUT_MS)
      : webhookTimeoutMs_(webhookTimeoutMs), commandTimeoutMs_(commandTimeoutMs) {}

  [[nodiscard]] bool run(const AlertAction& action, const AlertEvent& event,
                         const snapshot::SensorReading& reading, std::string* error) override;

private:
  bool notify(const AlertEvent& event, const snapshot::SensorReading& reading);
  bool webhook(const AlertAction& action, const AlertEvent& event,
               const snapshot::SensorReading& reading, std::string* error);
  bool command(const AlertAction& action, std::string* error);

  int webhookTimeoutMs_;
  int commandTimeoutMs_;
};

} // namespace alerts
} // namespace cascade

#endif // CASCADE_ALERTS_ACTION_RUNNER_HPP
