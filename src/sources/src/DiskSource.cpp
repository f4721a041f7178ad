/**
 * @file DiskSource.cpp
 * @brief Mounted filesystem usage from /proc/mounts + statvfs.
 */

#include "src/sources/inc/DiskSource.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/sources/inc/SysfsProbe.hpp"

#include <sys/statvfs.h>

#include <set>

namespace cascade {
namespace sources {

namespace {

/// Decode the \ooo escapes used by /proc/mounts.
std::string unescapeMount(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] == '\\' && i + 3 < raw.size()) {
      const char A = raw[i + 1];
      const char B = raw[i + 2];
      const char C = raw[i + 3];
      if (A >= '0' && A <= '7' && B >= '0' && B <= '7' && C >= '0' && C <= '7') {
        out.push_back(static_cast<char>((A - '0') * 64 + (B - '0') * 8 + (C - '0')));
        i += 3;
        continue;
      }
    }
    out.push_back(raw[i]);
  }
  return out;
}

} // namespace

/* ----------------------------- Parsing ----------------------------- */

std::vector<MountEntry> parseMounts(std::string_view text) {
  std::vector<MountEntry> out;
  std::set<std::string> seen;

  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t eol = text.find('\n', pos);
    if (eol == std::string_view::npos) {
      eol = text.size();
    }
    const std::vector<std::string_view> F =
        helpers::strings::splitWhitespace(text.substr(pos, eol - pos));
    pos = eol + 1;

    if (F.size() < 3 || !helpers::strings::startsWith(F[0], "/dev/")) {
      continue;
    }
    MountEntry e{};
    e.device = std::string(F[0]);
    if (!seen.insert(e.device).second) {
      continue;
    }
    e.mount = unescapeMount(F[1]);
    e.fsType = std::string(F[2]);
    out.push_back(std::move(e));
  }
  return out;
}

/* ----------------------------- DiskSource ----------------------------- */

std::optional<double> DiskSource::driveTemperature(const std::string& device) const {
  const std::string NAME = fs::path(device).filename().string();
  fs::path block = root_ / "sys/class/block" / NAME;

  // Partitions hang below their parent disk in the canonical sysfs path.
  std::error_code ec;
  if (helpers::files::pathExists(block / "partition")) {
    const fs::path REAL = fs::canonical(block, ec);
    if (ec) {
      return std::nullopt;
    }
    block = REAL.parent_path();
  }

  const auto HWMON = firstHwmonUnder(block / "device");
  if (!HWMON) {
    return std::nullopt;
  }
  return readChipTemperature(*HWMON).value;
}

std::optional<std::vector<snapshot::DiskData>> DiskSource::collect() {
  const std::string TEXT = helpers::files::readFile(root_ / "proc/mounts");
  if (TEXT.empty()) {
    return std::nullopt;
  }

  std::vector<snapshot::DiskData> disks;
  for (const MountEntry& M : parseMounts(TEXT)) {
    struct statvfs st{};
    if (::statvfs(M.mount.c_str(), &st) != 0 || st.f_blocks == 0) {
      continue;
    }
    snapshot::DiskData d{};
    d.device = M.device;
    d.mount = M.mount;
    d.fsType = M.fsType;
    d.sizeBytes = static_cast<std::uint64_t>(st.f_blocks) * st.f_frsize;
    d.availableBytes = static_cast<std::uint64_t>(st.f_bavail) * st.f_frsize;
    const std::uint64_t FREE = static_cast<std::uint64_t>(st.f_bfree) * st.f_frsize;
    d.usedBytes = d.sizeBytes > FREE ? d.sizeBytes - FREE : 0;
    const std::uint64_t USABLE = d.usedBytes + d.availableBytes;
    d.usePercent = USABLE > 0 ? static_cast<double>(d.usedBytes) * 100.0 /
                                    static_cast<double>(USABLE)
                              : 0.0;
    d.temperature = driveTemperature(M.device);
    d.index = static_cast<std::uint32_t>(disks.size());
    disks.push_back(std::move(d));
  }
  return disks;
}

} // namespace sources
} // namespace cascade
