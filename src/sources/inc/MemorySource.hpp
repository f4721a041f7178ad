#ifndef CASCADE_SOURCES_MEMORY_SOURCE_HPP
#define CASCADE_SOURCES_MEMORY_SOURCE_HPP
/**
 * @file MemorySource.hpp
 * @brief Memory adapter backed by /proc/meminfo.
 * @note Stateless; safe to call concurrently.
 */

#include "src/snapshot/inc/CategoryAdapter.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>

namespace cascade {
namespace sources {

/**
 * @brief Parse /proc/meminfo text.
 *
 * used = MemTotal - MemAvailable (MemFree when MemAvailable is missing).
 * @return nullopt when MemTotal is absent or zero.
 */
[[nodiscard]] std::optional<snapshot::MemoryData> parseMeminfo(std::string_view text);

class MemorySource final : public snapshot::MemoryAdapter {
public:
  explicit MemorySource(std::filesystem::path root = "/") : root_(std::move(root)) {}

  [[nodiscard]] const char* name() const noexcept override { return "memory"; }
  [[nodiscard]] std::optional<snapshot::MemoryData> collect() override;

private:
  std::filesystem::path root_;
};

} // namespace sources
} // namespace cascade

#endif // CASCADE_SOURCES_MEMORY_SOURCE_HPP
