/**
 * @file MemorySource.cpp
 * @brief /proc/meminfo parsing.
 */

#include "src/sources/inc/MemorySource.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cstdint>

namespace cascade {
namespace sources {

std::optional<snapshot::MemoryData> parseMeminfo(std::string_view text) {
  std::uint64_t totalKb = 0;
  std::uint64_t freeKb = 0;
  std::optional<std::uint64_t> availKb;
  std::uint64_t swapTotalKb = 0;
  std::uint64_t swapFreeKb = 0;

  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t eol = text.find('\n', pos);
    if (eol == std::string_view::npos) {
      eol = text.size();
    }
    const std::string_view LINE = text.substr(pos, eol - pos);
    pos = eol + 1;

    const std::size_t COLON = LINE.find(':');
    if (COLON == std::string_view::npos) {
      continue;
    }
    const std::string_view KEY = LINE.substr(0, COLON);
    // Value is "<n> kB"; parseInt64 stops at the unit.
    const std::uint64_t KB = static_cast<std::uint64_t>(
        helpers::strings::parseInt64(LINE.substr(COLON + 1)).value_or(0));

    if (KEY == "MemTotal") {
      totalKb = KB;
    } else if (KEY == "MemFree") {
      freeKb = KB;
    } else if (KEY == "MemAvailable") {
      availKb = KB;
    } else if (KEY == "SwapTotal") {
      swapTotalKb = KB;
    } else if (KEY == "SwapFree") {
      swapFreeKb = KB;
    }
  }

  if (totalKb == 0) {
    return std::nullopt;
  }

  snapshot::MemoryData mem{};
  mem.present = true;
  mem.totalBytes = totalKb * 1024;
  mem.freeBytes = freeKb * 1024;
  mem.availableBytes = availKb.value_or(freeKb) * 1024;
  mem.usedBytes = mem.totalBytes > mem.availableBytes ? mem.totalBytes - mem.availableBytes : 0;
  mem.swapTotalBytes = swapTotalKb * 1024;
  mem.swapUsedBytes = swapTotalKb > swapFreeKb ? (swapTotalKb - swapFreeKb) * 1024 : 0;
  mem.usedPercent =
      static_cast<double>(mem.usedBytes) * 100.0 / static_cast<double>(mem.totalBytes);
  return mem;
}

std::optional<snapshot::MemoryData> MemorySource::collect() {
  return parseMeminfo(helpers::files::readFile(root_ / "proc/meminfo"));
}

} // namespace sources
} // namespace cascade
