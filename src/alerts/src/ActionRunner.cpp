/**
 * @file ActionRunner.cpp
 * @brief Notification, webhook, command, sound and email actions.
 */

#include "src/alerts/inc/ActionRunner.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Json.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/snapshot/inc/SnapshotJson.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <thread>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <curl/curl.h>
#include <fmt/format.h>

namespace cascade {
namespace alerts {

namespace {

constexpr const char* LOG_CAT = "actions";

constexpr std::array<const char*, 2> NOTIFY_SEND_PATHS{"/usr/bin/notify-send",
                                                       "/usr/local/bin/notify-send"};
constexpr int NOTIFY_TIMEOUT_MS = 5000;
constexpr int CHILD_POLL_MS = 10;

void setError(std::string* error, std::string msg) {
  if (error != nullptr) {
    *error = std::move(msg);
  }
}

/* ----------------------------- Processes ----------------------------- */

/**
 * Fork, exec path with argv in a new process group, wait up to timeoutMs.
 * Exit status, or -1 on spawn failure, signal or timeout. On timeout the
 * group is killed so grandchildren of a shell go with it.
 */
int spawnAndWait(const char* path, const char* const argv[], int timeoutMs, std::string* error) {
  const pid_t PID = ::fork();
  if (PID < 0) {
    setError(error, fmt::format("fork failed: {}", std::strerror(errno)));
    return -1;
  }
  if (PID == 0) {
    ::setpgid(0, 0);
    ::execv(path, const_cast<char* const*>(argv));
    ::_exit(127);
  }
  // Either side may win the race; the loser's call is harmless.
  (void)::setpgid(PID, PID);

  const auto DEADLINE = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  int status = 0;
  for (;;) {
    const pid_t RC = ::waitpid(PID, &status, WNOHANG);
    if (RC == PID) {
      break;
    }
    if (RC < 0) {
      if (errno == EINTR) {
        continue;
      }
      setError(error, fmt::format("waitpid failed: {}", std::strerror(errno)));
      return -1;
    }
    if (std::chrono::steady_clock::now() >= DEADLINE) {
      if (::kill(-PID, SIGKILL) != 0) {
        (void)::kill(PID, SIGKILL);
      }
      while (::waitpid(PID, &status, 0) < 0 && errno == EINTR) {
      }
      setError(error, fmt::format("timed out after {} ms", timeoutMs));
      return -1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(CHILD_POLL_MS));
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  setError(error, "terminated by signal");
  return -1;
}

/* ----------------------------- libcurl ----------------------------- */

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

/// curl_global_init is not thread-safe; run it once for the process.
CURLcode curlGlobalInit() {
  static std::once_flag once;
  static CURLcode result = CURLE_OK;
  std::call_once(once, [] { result = curl_global_init(CURL_GLOBAL_DEFAULT); });
  return result;
}

/// Response bodies are not used.
std::size_t discardBody(char* /*ptr*/, std::size_t size, std::size_t nmemb, void* /*user*/) {
  return size * nmemb;
}

} // namespace

/* ----------------------------- HTTP ----------------------------- */

bool httpPostJson(const std::string& url, const std::string& body, int timeoutMs, long* status,
                  std::string* error) {
  const CURLcode INIT = curlGlobalInit();
  if (INIT != CURLE_OK) {
    setError(error, fmt::format("curl init failed: {}", curl_easy_strerror(INIT)));
    return false;
  }

  CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    setError(error, "curl_easy_init failed");
    return false;
  }

  curl_slist* list = curl_slist_append(nullptr, "Content-Type: application/json");
  if (list != nullptr) {
    // Suppress "Expect: 100-continue" so small receivers answer in one round trip.
    curl_slist* more = curl_slist_append(list, "Expect:");
    list = more != nullptr ? more : list;
  }
  const CurlHeaders HEADERS(list, &curl_slist_free_all);

  CURL* c = curl.get();
  curl_easy_setopt(c, CURLOPT_URL, url.c_str());
  curl_easy_setopt(c, CURLOPT_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(c, CURLOPT_HTTPHEADER, HEADERS.get());
  curl_easy_setopt(c, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, &discardBody);
  curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, static_cast<long>(timeoutMs));
  curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);

  const CURLcode RC = curl_easy_perform(c);
  if (RC != CURLE_OK) {
    setError(error, fmt::format("POST {}: {}", url, curl_easy_strerror(RC)));
    return false;
  }

  long code = 0;
  curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &code);
  if (status != nullptr) {
    *status = code;
  }
  if (code < 200 || code > 299) {
    setError(error, fmt::format("{} answered HTTP {}", url, code));
    return false;
  }
  return true;
}

/* ----------------------------- Shell ----------------------------- */

int runShell(const std::string& command, int timeoutMs, std::string* error) {
  const char* const ARGV[] = {"sh", "-c", command.c_str(), nullptr};
  return spawnAndWait("/bin/sh", ARGV, timeoutMs, error);
}

/* ----------------------------- DefaultActionRunner ----------------------------- */

bool DefaultActionRunner::run(const AlertAction& action, const AlertEvent& event,
                              const snapshot::SensorReading& reading, std::string* error) {
  switch (action.type) {
  case ActionType::Notification:
    return notify(event, reading);
  case ActionType::Webhook:
    return webhook(action, event, reading, error);
  case ActionType::Command:
    return command(action, error);
  case ActionType::Sound:
    std::fputc('\a', stderr);
    std::fflush(stderr);
    return true;
  case ActionType::Email:
    helpers::log::info(LOG_CAT, "email action for '{}' skipped: requires SMTP configuration",
                       event.alertName);
    return true;
  }
  setError(error, "unknown action type");
  return false;
}

bool DefaultActionRunner::notify(const AlertEvent& event, const snapshot::SensorReading& reading) {
  const std::string TITLE = fmt::format("Hardware Alert: {}", event.alertName);
  const std::string BODY = fmt::format("{}: {:.1f}{}", reading.name, reading.value, reading.unit);

  for (const char* path : NOTIFY_SEND_PATHS) {
    if (!helpers::files::pathExists(path)) {
      continue;
    }
    const char* const ARGV[] = {"notify-send", TITLE.c_str(), BODY.c_str(), nullptr};
    std::string err;
    const int RC = spawnAndWait(path, ARGV, NOTIFY_TIMEOUT_MS, &err);
    if (RC == 0) {
      return true;
    }
    helpers::log::debug(LOG_CAT, "notify-send exited {} {}", RC, err);
    break;
  }
  helpers::log::info(LOG_CAT, "{} - {}", TITLE, BODY);
  return true;
}

bool DefaultActionRunner::webhook(const AlertAction& action, const AlertEvent& event,
                                  const snapshot::SensorReading& reading, std::string* error) {
  const std::string URL = action.config["url"].asString();
  Json::Value body(Json::objectValue);
  body["event"] = toJson(event);
  body["reading"] = snapshot::toJson(reading);

  long status = 0;
  if (!httpPostJson(URL, helpers::json::dumpCompact(body), webhookTimeoutMs_, &status, error)) {
    return false;
  }
  helpers::log::debug(LOG_CAT, "webhook {} -> {}", URL, status);
  return true;
}

bool DefaultActionRunner::command(const AlertAction& action, std::string* error) {
  const std::string CMD = action.config["command"].asString();
  const int RC = runShell(CMD, commandTimeoutMs_, error);
  if (RC < 0) {
    return false;
  }
  if (RC != 0) {
    setError(error, fmt::format("command exited with status {}", RC));
    helpers::log::warn(LOG_CAT, "command '{}' exited {}", CMD, RC);
    return false;
  }
  helpers::log::debug(LOG_CAT, "command '{}' exited 0", CMD);
  return true;
}

} // namespace alerts
} // namespace cascade
