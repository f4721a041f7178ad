#ifndef CASCADE_HELPERS_CLOCK_HPP
#define CASCADE_HELPERS_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Wall-clock and monotonic time sources.
 *
 * Components that stamp or compare times take a ClockFn so tests can drive
 * time explicitly.
 */

#include <cstdint>
#include <ctime> // clock_gettime
#include <functional>

namespace cascade {
namespace helpers {
namespace clock {

/// Returns milliseconds since the Unix epoch.
using ClockFn = std::function<std::int64_t()>;

/**
 * @brief Wall-clock time in epoch milliseconds.
 * @note Uses CLOCK_REALTIME; may step backwards on clock adjustment.
 */
[[nodiscard]] inline std::int64_t nowMs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<std::int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1'000'000;
}

/**
 * @brief Monotonic timestamp in nanoseconds.
 * @note Unaffected by clock adjustment; use for intervals and rates.
 */
[[nodiscard]] inline std::uint64_t getMonotonicNs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

/// Default ClockFn bound to nowMs().
[[nodiscard]] inline ClockFn systemClock() {
  return [] { return nowMs(); };
}

} // namespace clock
} // namespace helpers
} // namespace cascade

#endif // CASCADE_HELPERS_CLOCK_HPP
