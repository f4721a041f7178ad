#ifndef CASCADE_SOURCES_NETWORK_SOURCE_HPP
#define CASCADE_SOURCES_NETWORK_SOURCE_HPP
/**
 * @file NetworkSource.hpp
 * @brief Network adapter: per-interface byte counters and rates.
 * @note Linux-only. Reads /sys/class/net/<if>/statistics/. Rates are computed
 *       against the previous collect(); the first call reports 0 B/s.
 */

#include "src/snapshot/inc/CategoryAdapter.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cascade {
namespace sources {

class NetworkSource final : public snapshot::NetworkAdapter {
public:
  /// @param includeLoopback Report "lo" as well.
  explicit NetworkSource(std::filesystem::path root = "/", bool includeLoopback = false);

  [[nodiscard]] const char* name() const noexcept override { return "network"; }

  /// nullopt when /sys/class/net is missing.
  [[nodiscard]] std::optional<std::vector<snapshot::NetworkData>> collect() override;

private:
  struct Sample {
    std::uint64_t rx{0};
    std::uint64_t tx{0};
    std::uint64_t monoNs{0};
  };

  std::filesystem::path root_;
  bool includeLoopback_;
  std::mutex mtx_;
  std::map<std::string, Sample> prev_;
};

} // namespace sources
} // namespace cascade

#endif // CASCADE_SOURCES_NETWORK_SOURCE_HPP
