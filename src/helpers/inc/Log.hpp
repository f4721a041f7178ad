#ifndef CASCADE_HELPERS_LOG_HPP
#define CASCADE_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Process-wide leveled logger built on {fmt}.
 *
 * Line format: "YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [category] message".
 * Lines go to stderr and, when configured, are appended to a log file.
 *
 * Call sites use debug(), info(), warn() and error() with a category and a fmt
 * format string; arguments are not formatted when the level is filtered out.
 *
 * @note Thread-safe: writes are serialized by an internal mutex.
 */

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>

namespace cascade {
namespace helpers {
namespace log {

/* ----------------------------- Level ----------------------------- */

enum class Level : std::uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/// Upper-case tag used in log lines.
[[nodiscard]] inline const char* toString(Level level) noexcept {
  switch (level) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warn:
    return "WARN";
  case Level::Error:
    return "ERROR";
  case Level::Off:
    return "OFF";
  }
  return "?";
}

/// Parse "debug", "info", "warn", "error" or "off" (either case).
[[nodiscard]] inline bool parseLevel(std::string_view text, Level& out) noexcept {
  std::string lower(text.size(), '\0');
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char C = text[i];
    lower[i] = (C >= 'A' && C <= 'Z') ? static_cast<char>(C - 'A' + 'a') : C;
  }
  if (lower == "debug") {
    out = Level::Debug;
  } else if (lower == "info") {
    out = Level::Info;
  } else if (lower == "warn" || lower == "warning") {
    out = Level::Warn;
  } else if (lower == "error") {
    out = Level::Error;
  } else if (lower == "off" || lower == "none") {
    out = Level::Off;
  } else {
    return false;
  }
  return true;
}

/* ----------------------------- Logger ----------------------------- */

class Logger {
public:
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  /// Shared instance used by the level functions.
  static Logger& instance() noexcept {
    static Logger logger;
    return logger;
  }

  void setLevel(Level level) noexcept { level_.store(level, std::memory_order_relaxed); }

  [[nodiscard]] Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

  [[nodiscard]] bool enabled(Level level) const noexcept {
    return level != Level::Off && level >= this->level();
  }

  /**
   * @brief Also append lines to path; empty path closes the file sink.
   * @return false if the file cannot be opened (stderr output continues).
   */
  [[nodiscard]] bool setFile(const std::string& path, std::string* error = nullptr) noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
    if (path.empty()) {
      return true;
    }
    file_ = std::fopen(path.c_str(), "a");
    if (file_ == nullptr) {
      if (error != nullptr) {
        *error = fmt::format("cannot open log file '{}'", path);
      }
      return false;
    }
    return true;
  }

  /// Suppress stderr output (tests, file-only daemons).
  void setConsole(bool enabled) noexcept { console_.store(enabled, std::memory_order_relaxed); }

  /// Write one preformatted message.
  void write(Level level, std::string_view category, std::string_view message) {
    const std::string LINE =
        fmt::format("{} [{}] [{}] {}\n", timestamp(), toString(level), category, message);

    std::lock_guard<std::mutex> lock(mtx_);
    if (console_.load(std::memory_order_relaxed)) {
      std::fwrite(LINE.data(), 1, LINE.size(), stderr);
    }
    if (file_ != nullptr) {
      std::fwrite(LINE.data(), 1, LINE.size(), file_);
      std::fflush(file_);
    }
  }

private:
  Logger() = default;

  ~Logger() {
    if (file_ != nullptr) {
      std::fclose(file_);
    }
  }

  static std::string timestamp() {
    struct timespec ts{};
    ::clock_gettime(CLOCK_REALTIME, &ts);
    struct tm tmv{};
    ::localtime_r(&ts.tv_sec, &tmv);
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}", tmv.tm_year + 1900,
                       tmv.tm_mon + 1, tmv.tm_mday, tmv.tm_hour, tmv.tm_min, tmv.tm_sec,
                       ts.tv_nsec / 1'000'000);
  }

  std::mutex mtx_;
  std::FILE* file_{nullptr};
  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> console_{true};
};

/// Format and write when level is enabled.
template <typename... Args>
inline void logf(Level level, std::string_view category, fmt::format_string<Args...> format,
                 Args&&... args) {
  Logger& logger = Logger::instance();
  if (!logger.enabled(level)) {
    return;
  }
  logger.write(level, category, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
inline void debug(std::string_view category, fmt::format_string<Args...> format, Args&&... args) {
  logf(Level::Debug, category, format, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(std::string_view category, fmt::format_string<Args...> format, Args&&... args) {
  logf(Level::Info, category, format, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(std::string_view category, fmt::format_string<Args...> format, Args&&... args) {
  logf(Level::Warn, category, format, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(std::string_view category, fmt::format_string<Args...> format, Args&&... args) {
  logf(Level::Error, category, format, std::forward<Args>(args)...);
}

} // namespace log
} // namespace helpers
} // namespace cascade

#endif // CASCADE_HELPERS_LOG_HPP
