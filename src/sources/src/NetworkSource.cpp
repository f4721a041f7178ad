/**
 * @file NetworkSource.cpp
 * @brief Interface counters from /sys/class/net.
 */

#include "src/sources/inc/NetworkSource.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Files.hpp"

#include <utility>

namespace cascade {
namespace sources {

namespace {

/// Counter delta per second; 0 on wrap/reset or zero interval.
double ratePerSec(std::uint64_t before, std::uint64_t after, std::uint64_t intervalNs) noexcept {
  if (intervalNs == 0 || after < before) {
    return 0.0;
  }
  return static_cast<double>(after - before) * 1e9 / static_cast<double>(intervalNs);
}

} // namespace

NetworkSource::NetworkSource(std::filesystem::path root, bool includeLoopback)
    : root_(std::move(root)), includeLoopback_(includeLoopback) {}

std::optional<std::vector<snapshot::NetworkData>> NetworkSource::collect() {
  const std::filesystem::path NET = root_ / "sys/class/net";
  if (!helpers::files::pathExists(NET)) {
    return std::nullopt;
  }

  const std::uint64_t NOW_NS = helpers::clock::getMonotonicNs();
  std::vector<snapshot::NetworkData> out;
  std::map<std::string, Sample> current;

  std::lock_guard<std::mutex> lock(mtx_);
  for (const auto& DIR : helpers::files::listDir(NET)) {
    const std::string IFACE = DIR.filename().string();
    if (IFACE == "lo" && !includeLoopback_) {
      continue;
    }
    const std::int64_t RX = helpers::files::readInt64(DIR / "statistics/rx_bytes", -1);
    const std::int64_t TX = helpers::files::readInt64(DIR / "statistics/tx_bytes", -1);
    if (RX < 0 || TX < 0) {
      continue;
    }

    snapshot::NetworkData n{};
    n.iface = IFACE;
    n.operstate = helpers::files::readLine(DIR / "operstate");
    if (n.operstate.empty()) {
      n.operstate = "unknown";
    }
    n.rxBytes = static_cast<std::uint64_t>(RX);
    n.txBytes = static_cast<std::uint64_t>(TX);

    const auto PREV = prev_.find(IFACE);
    if (PREV != prev_.end() && NOW_NS > PREV->second.monoNs) {
      const std::uint64_t DT = NOW_NS - PREV->second.monoNs;
      n.rxSec = ratePerSec(PREV->second.rx, n.rxBytes, DT);
      n.txSec = ratePerSec(PREV->second.tx, n.txBytes, DT);
    }

    current[IFACE] = Sample{n.rxBytes, n.txBytes, NOW_NS};
    out.push_back(std::move(n));
  }
  prev_ = std::move(current);
  return out;
}

} // namespace sources
} // namespace cascade
