/**
 * @file cascade-snapshot.cpp
 * @brief One-shot hardware snapshot.
 *
 * Polls every category once and prints the snapshot plus its canonical
 * readings as JSON, or a one-line-per-device summary with --brief.
 * --unified adds the merged hwmon and thermal-zone sensors.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Json.hpp"
#include "src/snapshot/inc/MonitorSettings.hpp"
#include "src/snapshot/inc/ReadingExtractor.hpp"
#include "src/snapshot/inc/SnapshotComposer.hpp"
#include "src/snapshot/inc/SnapshotJson.hpp"
#include "src/sources/inc/LinuxAdapters.hpp"
#include "src/unified/inc/HwmonSource.hpp"
#include "src/unified/inc/ThermalZoneSource.hpp"
#include "src/unified/inc/UnifiedNormalizer.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <json/json.h>

namespace args = cascade::helpers::args;
namespace snapshot = cascade::snapshot;
namespace unified = cascade::unified;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_BRIEF = 1,
  ARG_UNIFIED = 2,
  ARG_ONLY = 3,
};

constexpr std::string_view DESCRIPTION =
    "Print one hardware snapshot.\n"
    "JSON by default: {\"snapshot\": ..., \"readings\": [...]}.";

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_BRIEF] = {"--brief", 0, false, "Human-readable summary instead of JSON"};
  map[ARG_UNIFIED] = {"--unified", 0, false, "Include merged hwmon/thermal-zone sensors"};
  map[ARG_ONLY] = {"--only", 1, false, "Comma-separated categories (cpu,gpu,memory,disk,network)"};
  return map;
}

std::vector<std::string> splitCommas(std::string_view text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= text.size()) {
    const std::size_t COMMA = text.find(',', start);
    const std::size_t END = COMMA == std::string_view::npos ? text.size() : COMMA;
    if (END > start) {
      out.emplace_back(text.substr(start, END - start));
    }
    if (COMMA == std::string_view::npos) {
      break;
    }
    start = COMMA + 1;
  }
  return out;
}

unified::UnifiedData collectUnified() {
  unified::UnifiedNormalizer normalizer;
  normalizer.addSource(std::make_shared<unified::HwmonSource>());
  normalizer.addSource(std::make_shared<unified::ThermalZoneSource>());
  return normalizer.merge();
}

/* ----------------------------- Human Output ----------------------------- */

void printBrief(const snapshot::Snapshot& snap, const unified::UnifiedData* data) {
  fmt::print("{}\n", snap.toString());
  if (data == nullptr) {
    return;
  }
  fmt::print("\n=== Unified Sensors ({}) ===\n", data->sensors.size());
  for (const unified::UnifiedSensor& S : data->sensors) {
    fmt::print("  {}\n", S.toString());
  }
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  const std::vector<std::string_view> TOKENS = args::collectArgs(argc, argv);
  args::ParsedArgs pargs;

  std::string error;
  if (!args::parseArgs(TOKENS, ARG_MAP, pargs, &error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }
  if (args::has(pargs, ARG_HELP)) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  snapshot::MonitorSettings settings;
  if (const auto ONLY = args::value(pargs, ARG_ONLY)) {
    const auto SET = snapshot::EnabledSet::fromNames(splitCommas(*ONLY), &error);
    if (!SET) {
      fmt::print(stderr, "Error: {}\n", error);
      return 1;
    }
    settings.replace(*SET);
  }

  snapshot::SnapshotComposer composer(cascade::sources::makeLinuxAdapters(), settings);
  const snapshot::SnapshotPtr SNAP = composer.poll();

  const bool WITH_UNIFIED = args::has(pargs, ARG_UNIFIED);
  unified::UnifiedData data{};
  if (WITH_UNIFIED) {
    data = collectUnified();
  }

  if (args::has(pargs, ARG_BRIEF)) {
    printBrief(*SNAP, WITH_UNIFIED ? &data : nullptr);
    return 0;
  }

  Json::Value out(Json::objectValue);
  out["snapshot"] = snapshot::toJson(*SNAP);
  out["readings"] = snapshot::toJson(snapshot::extractReadings(*SNAP));
  if (WITH_UNIFIED) {
    out["unified"] = unified::toJson(data);
  }
  fmt::print("{}\n", cascade::helpers::json::dumpPretty(out));
  return 0;
}
