/**
 * @file PluginRegistry.cpp
 * @brief Plugin lifecycle and polling.
 */

#include "src/unified/inc/PluginRegistry.hpp"
#include "src/helpers/inc/Log.hpp"

#include <exception>
#include <utility>

#include <fmt/format.h>

namespace cascade {
namespace unified {

namespace {

constexpr const char* LOG_CAT = "plugins";

/// Run one lifecycle step; marks the entry Failed on false or throw.
template <typename Step>
void runStep(PluginInfo& info, const char* stepName, PluginState onSuccess, Step&& step) {
  try {
    if (step()) {
      info.state = onSuccess;
      info.error.clear();
      return;
    }
    info.error = fmt::format("{} returned failure", stepName);
  } catch (const std::exception& e) {
    info.error = fmt::format("{} threw: {}", stepName, e.what());
  }
  info.state = PluginState::Failed;
  helpers::log::error(LOG_CAT, "plugin '{}' disabled: {}", info.metadata.id, info.error);
}

} // namespace

const char* toString(PluginState state) noexcept {
  switch (state) {
  case PluginState::Registered:
    return "registered";
  case PluginState::Initialized:
    return "initialized";
  case PluginState::Running:
    return "running";
  case PluginState::Stopped:
    return "stopped";
  case PluginState::Destroyed:
    return "destroyed";
  case PluginState::Failed:
    return "failed";
  }
  return "?";
}

PluginRegistry::~PluginRegistry() {
  stopAll();
  destroyAll();
}

bool PluginRegistry::registerPlugin(std::unique_ptr<Plugin> plugin, std::string* error) {
  if (!plugin) {
    if (error != nullptr) {
      *error = "null plugin";
    }
    return false;
  }
  const PluginMetadata META = plugin->metadata();

  std::lock_guard<std::mutex> lock(mtx_);
  for (const Entry& E : entries_) {
    if (E.info.metadata.id == META.id) {
      if (error != nullptr) {
        *error = fmt::format("plugin id '{}' already registered", META.id);
      }
      return false;
    }
  }
  Entry entry{std::move(plugin), PluginInfo{META, PluginState::Registered, {}}};
  entries_.push_back(std::move(entry));
  helpers::log::info(LOG_CAT, "registered plugin {} v{}", META.name, META.version);
  return true;
}

void PluginRegistry::initAll() {
  std::lock_guard<std::mutex> lock(mtx_);
  for (Entry& e : entries_) {
    if (e.info.state == PluginState::Registered) {
      Plugin* p = e.plugin.get();
      runStep(e.info, "init", PluginState::Initialized, [p] { return p->init(); });
    }
  }
}

void PluginRegistry::startAll() {
  std::lock_guard<std::mutex> lock(mtx_);
  for (Entry& e : entries_) {
    if (e.info.state == PluginState::Initialized || e.info.state == PluginState::Stopped) {
      Plugin* p = e.plugin.get();
      runStep(e.info, "start", PluginState::Running, [p] { return p->start(); });
    }
  }
}

void PluginRegistry::stopAll() {
  std::lock_guard<std::mutex> lock(mtx_);
  for (Entry& e : entries_) {
    if (e.info.state == PluginState::Running) {
      Plugin* p = e.plugin.get();
      runStep(e.info, "stop", PluginState::Stopped, [p] {
        p->stop();
        return true;
      });
    }
  }
}

void PluginRegistry::destroyAll() {
  std::lock_guard<std::mutex> lock(mtx_);
  for (Entry& e : entries_) {
    if (e.info.state == PluginState::Destroyed || e.info.state == PluginState::Running) {
      continue;
    }
    // Failed plugins are destroyed too but keep their error text.
    try {
      e.plugin->destroy();
    } catch (const std::exception& ex) {
      helpers::log::error(LOG_CAT, "plugin '{}' destroy threw: {}", e.info.metadata.id, ex.what());
    }
    e.info.state = PluginState::Destroyed;
  }
}

std::vector<PluginInfo> PluginRegistry::list() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<PluginInfo> out;
  out.reserve(entries_.size());
  for (const Entry& E : entries_) {
    out.push_back(E.info);
  }
  return out;
}

std::size_t PluginRegistry::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return entries_.size();
}

bool PluginRegistry::available() {
  std::lock_guard<std::mutex> lock(mtx_);
  for (const Entry& E : entries_) {
    if (E.info.state == PluginState::Running) {
      return true;
    }
  }
  return false;
}

std::vector<RawSensor> PluginRegistry::read() {
  std::vector<RawSensor> out;
  std::lock_guard<std::mutex> lock(mtx_);
  for (Entry& e : entries_) {
    if (e.info.state != PluginState::Running) {
      continue;
    }
    try {
      for (RawSensor& s : e.plugin->poll()) {
        s.id = fmt::format("{}-{}", e.info.metadata.id, s.id);
        if (s.hardware.empty()) {
          s.hardware = e.info.metadata.name;
        }
        out.push_back(std::move(s));
      }
    } catch (const std::exception& ex) {
      helpers::log::warn(LOG_CAT, "plugin '{}' poll failed: {}", e.info.metadata.id, ex.what());
    }
  }
  return out;
}

} // namespace unified
} // namespace cascade
