/**
 * @file CpuSource.cpp
 * @brief CPU load, identity and package temperature from procfs/sysfs.
 */

#include "src/sources/inc/CpuSource.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/sources/inc/SysfsProbe.hpp"

#include <algorithm>
#include <utility>

namespace cascade {
namespace sources {

namespace {

using helpers::strings::parseDouble;
using helpers::strings::splitWhitespace;
using helpers::strings::startsWith;
using helpers::strings::trim;

/// Fold one "cpu[N] user nice system idle iowait ..." line.
CpuTimes foldCpuLine(const std::vector<std::string_view>& fields) {
  CpuTimes t{};
  for (std::size_t i = 1; i < fields.size(); ++i) {
    const std::uint64_t V =
        static_cast<std::uint64_t>(helpers::strings::parseInt64(fields[i]).value_or(0));
    t.total += V;
    if (i == 4 || i == 5) { // idle, iowait
      t.idle += V;
    }
  }
  return t;
}

/// Package temperature: known CPU hwmon chips first, then thermal zones.
ChipTemperature readPackageTemperature(const std::filesystem::path& root) {
  const auto CHIP =
      findHwmonByName(root, {"coretemp", "k10temp", "zenpower", "cpu_thermal", "soc_thermal"});
  if (CHIP) {
    const ChipTemperature T = readChipTemperature(*CHIP);
    if (T.value) {
      return T;
    }
  }

  for (const auto& ZONE : helpers::files::listDir(root / "sys/class/thermal", "thermal_zone")) {
    const std::string TYPE = helpers::files::readLine(ZONE / "type");
    if (TYPE == "x86_pkg_temp" || TYPE == "cpu-thermal" || TYPE == "cpu_thermal") {
      ChipTemperature t{};
      t.value = readMilliCelsius(ZONE / "temp");
      if (t.value) {
        return t;
      }
    }
  }
  return {};
}

} // namespace

/* ----------------------------- Parsing ----------------------------- */

ProcStat parseProcStat(std::string_view text) {
  ProcStat out{};
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t eol = text.find('\n', pos);
    if (eol == std::string_view::npos) {
      eol = text.size();
    }
    const std::string_view LINE = text.substr(pos, eol - pos);
    pos = eol + 1;

    if (!startsWith(LINE, "cpu")) {
      continue;
    }
    const std::vector<std::string_view> FIELDS = splitWhitespace(LINE);
    if (FIELDS.size() < 5) {
      continue;
    }
    if (FIELDS[0] == "cpu") {
      out.aggregate = foldCpuLine(FIELDS);
    } else {
      out.perCore.push_back(foldCpuLine(FIELDS));
    }
  }
  return out;
}

double busyPercent(const CpuTimes& before, const CpuTimes& after) noexcept {
  if (after.total <= before.total) {
    return 0.0;
  }
  const double TOTAL = static_cast<double>(after.total - before.total);
  const double IDLE =
      after.idle >= before.idle ? static_cast<double>(after.idle - before.idle) : 0.0;
  return std::clamp((TOTAL - IDLE) * 100.0 / TOTAL, 0.0, 100.0);
}

CpuInfo parseCpuInfo(std::string_view text) {
  CpuInfo info{};
  double mhzSum = 0.0;
  std::uint32_t mhzCount = 0;

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
    const std::string_view KEY = trim(LINE.substr(0, COLON));
    const std::string_view VALUE = trim(LINE.substr(COLON + 1));

    if (KEY == "processor") {
      ++info.cpus;
    } else if (KEY == "model name" && info.brand.empty()) {
      info.brand = std::string(VALUE);
    } else if (KEY == "cpu MHz") {
      if (const auto MHZ = parseDouble(VALUE)) {
        mhzSum += *MHZ;
        ++mhzCount;
      }
    }
  }
  if (mhzCount > 0) {
    info.meanMhz = mhzSum / mhzCount;
  }
  return info;
}

/* ----------------------------- CpuSource ----------------------------- */

CpuSource::CpuSource(std::filesystem::path root) : root_(std::move(root)) {}

std::optional<snapshot::CpuData> CpuSource::collect() {
  const std::string STAT_TEXT = helpers::files::readFile(root_ / "proc/stat");
  if (STAT_TEXT.empty()) {
    return std::nullopt;
  }
  const ProcStat NOW = parseProcStat(STAT_TEXT);

  snapshot::CpuData cpu{};
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (prev_) {
      cpu.load = busyPercent(prev_->aggregate, NOW.aggregate);
      const std::size_t N = std::min(prev_->perCore.size(), NOW.perCore.size());
      for (std::size_t i = 0; i < N; ++i) {
        cpu.coreLoads.push_back(busyPercent(prev_->perCore[i], NOW.perCore[i]));
      }
    } else {
      cpu.coreLoads.assign(NOW.perCore.size(), 0.0);
    }
    prev_ = NOW;
  }

  const CpuInfo INFO = parseCpuInfo(helpers::files::readFile(root_ / "proc/cpuinfo"));
  cpu.brand = INFO.brand;
  cpu.cores = INFO.cpus > 0 ? INFO.cpus : static_cast<std::uint32_t>(NOW.perCore.size());
  cpu.speedMhz = INFO.meanMhz;

  const ChipTemperature TEMP = readPackageTemperature(root_);
  cpu.temperature = TEMP.value;
  cpu.temperatureMax = TEMP.max;
  cpu.present = true;
  return cpu;
}

} // namespace sources
} // namespace cascade
