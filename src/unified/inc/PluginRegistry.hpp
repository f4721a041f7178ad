#ifndef CASCADE_UNIFIED_PLUGIN_REGISTRY_HPP
#define CASCADE_UNIFIED_PLUGIN_REGISTRY_HPP
/**
 * @file PluginRegistry.hpp
 * @brief Lifecycle driver for registered plugins; the "plugin" normalization source.
 *
 * Plugins are registered in code at start-up. A plugin whose lifecycle call
 * fails or throws is marked Failed and skipped from then on. Sensor ids are
 * prefixed with the plugin id.
 *
 * @note Thread-safe.
 */

#include "src/unified/inc/NormalizationSource.hpp"
#include "src/unified/inc/Plugin.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cascade {
namespace unified {

enum class PluginState : std::uint8_t {
  Registered = 0,
  Initialized,
  Running,
  Stopped,
  Destroyed,
  Failed
};

[[nodiscard]] const char* toString(PluginState state) noexcept;

/// Registry view of one plugin.
struct PluginInfo {
  PluginMetadata metadata{};
  PluginState state{PluginState::Registered};
  std::string error{}; ///< Last failure, empty if none
};

class PluginRegistry final : public NormalizationSource {
public:
  PluginRegistry() = default;
  ~PluginRegistry() override;

  PluginRegistry(const PluginRegistry&) = delete;
  PluginRegistry& operator=(const PluginRegistry&) = delete;

  /// Register a plugin; false if null or its id is already taken.
  [[nodiscard]] bool registerPlugin(std::unique_ptr<Plugin> plugin,
                                    std::string* error = nullptr);

  void initAll();
  void startAll();
  void stopAll();
  void destroyAll();

  [[nodiscard]] std::vector<PluginInfo> list() const;
  [[nodiscard]] std::size_t size() const;

  /* ----------------------------- NormalizationSource ----------------------------- */

  [[nodiscard]] const char* name() const noexcept override { return "plugins"; }
  [[nodiscard]] const char* tag() const noexcept override { return "plugin"; }

  /// True when at least one plugin is running.
  [[nodiscard]] bool available() override;

  /// Poll every running plugin; a throwing plugin contributes nothing.
  [[nodiscard]] std::vector<RawSensor> read() override;

private:
  struct Entry {
    std::unique_ptr<Plugin> plugin;
    PluginInfo info;
  };

  mutable std::mutex mtx_;
  std::vector<Entry> entries_;
};

} // namespace unified
} // namespace cascade

#endif // CASCADE_UNIFIED_PLUGIN_REGISTRY_HPP
