/**
 * @file cascade-daemon.cpp
 * @brief Long-running telemetry service with the line-protocol subscriber endpoint.
 *
 * Loads the config file (writing defaults when missing), applies command-line
 * overrides, starts polling, history, alerts and the unified timer, and serves
 * subscribers until SIGINT or SIGTERM.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/hub/inc/LineServer.hpp"
#include "src/service/inc/MonitorConfig.hpp"
#include "src/service/inc/TelemetryService.hpp"
#include "src/sources/inc/LinuxAdapters.hpp"
#include "src/unified/inc/HwmonSource.hpp"
#include "src/unified/inc/ThermalZoneSource.hpp"

#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <pthread.h>

#include <fmt/core.h>
#include <json/json.h>

namespace args = cascade::helpers::args;
namespace logging = cascade::helpers::log;
namespace service = cascade::service;

namespace {

constexpr const char* LOG_CAT = "daemon";

/* ----------------------------- Argument Handling ----------------------------- */

enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_CONFIG = 1,
  ARG_PORT = 2,
  ARG_INTERVAL = 3,
  ARG_LOG_LEVEL = 4,
  ARG_LOG_FILE = 5,
};

constexpr std::string_view DESCRIPTION =
    "Hardware telemetry daemon.\n"
    "Polls CPU, GPU, memory, disk and network, keeps history, evaluates alerts\n"
    "and streams newline-delimited JSON to subscribers.";

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_CONFIG] = {"--config", 1, false, "Config file (default: config/cascade.json)"};
  map[ARG_PORT] = {"--port", 1, false, "Subscriber port, overrides wsPort"};
  map[ARG_INTERVAL] = {"--interval", 1, false, "Polling interval in ms, overrides config"};
  map[ARG_LOG_LEVEL] = {"--log-level", 1, false, "debug, info, warn, error or off (env CASCADE_LOG_LEVEL)"};
  map[ARG_LOG_FILE] = {"--log-file", 1, false, "Also append log lines to this file"};
  return map;
}

/// Apply --port and --interval on top of the loaded config.
bool applyOverrides(const args::ParsedArgs& pargs, service::MonitorConfig& config,
                    std::string& error) {
  Json::Value patch(Json::objectValue);
  if (const auto PORT = args::value(pargs, ARG_PORT)) {
    const auto N = cascade::helpers::strings::parseInt64(*PORT);
    if (!N) {
      error = fmt::format("invalid --port '{}'", *PORT);
      return false;
    }
    patch["wsPort"] = static_cast<Json::Int64>(*N);
  }
  if (const auto INTERVAL = args::value(pargs, ARG_INTERVAL)) {
    const auto N = cascade::helpers::strings::parseInt64(*INTERVAL);
    if (!N) {
      error = fmt::format("invalid --interval '{}'", *INTERVAL);
      return false;
    }
    patch["pollingInterval"] = static_cast<Json::Int64>(*N);
  }
  return service::updateConfig(config, patch, &error);
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

  logging::Logger& logger = logging::Logger::instance();
  std::optional<std::string_view> levelText = args::value(pargs, ARG_LOG_LEVEL);
  if (!levelText) {
    if (const char* ENV = std::getenv("CASCADE_LOG_LEVEL")) {
      levelText = ENV;
    }
  }
  if (const auto LEVEL = levelText) {
    logging::Level level{};
    if (!logging::parseLevel(*LEVEL, level)) {
      fmt::print(stderr, "Error: unknown log level '{}'\n", *LEVEL);
      return 1;
    }
    logger.setLevel(level);
  }
  if (const auto LOG_FILE = args::value(pargs, ARG_LOG_FILE)) {
    if (!logger.setFile(std::string(*LOG_FILE), &error)) {
      fmt::print(stderr, "Error: cannot open log file: {}\n", error);
      return 1;
    }
  }

  const std::string CONFIG_PATH =
      std::string(args::value(pargs, ARG_CONFIG).value_or(service::DEFAULT_CONFIG_PATH));
  service::MonitorConfig config = service::loadConfig(CONFIG_PATH);
  if (!applyOverrides(pargs, config, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }

  // Block the stop signals before any worker thread exists so only sigwait sees them.
  sigset_t stopSignals;
  sigemptyset(&stopSignals);
  sigaddset(&stopSignals, SIGINT);
  sigaddset(&stopSignals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

  service::TelemetryService svc(config, cascade::sources::makeLinuxAdapters());
  svc.addUnifiedSource(std::make_shared<cascade::unified::HwmonSource>());
  svc.addUnifiedSource(std::make_shared<cascade::unified::ThermalZoneSource>());

  cascade::hub::LineServerOptions serverOptions{};
  serverOptions.bindAddress = config.bindAddress;
  serverOptions.port = config.wsPort;
  cascade::hub::LineServer server(svc.hub(), serverOptions);
  if (!server.start(&error)) {
    logging::error(LOG_CAT, "cannot listen on {}:{}: {}", config.bindAddress, config.wsPort,
                   error);
    return 1;
  }

  svc.start();
  logging::info(LOG_CAT, "serving on {}:{} (auth {})", config.bindAddress, server.port(),
                config.enableAuth ? "on" : "off");

  int sig = 0;
  while (sigwait(&stopSignals, &sig) != 0) {
  }
  logging::info(LOG_CAT, "signal {} received, shutting down", sig);

  svc.stop();
  server.stop();
  return 0;
}
