#ifndef CASCADE_UNIFIED_PLUGIN_HPP
#define CASCADE_UNIFIED_PLUGIN_HPP
/**
 * @file Plugin.hpp
 * @brief Statically registered sensor plugin.
 *
 * Lifecycle: init -> start -> (poll)* -> stop -> destroy. Lifecycle calls
 * return false (or throw) on failure; the registry then disables the plugin.
 */

#include "src/unified/inc/UnifiedSensor.hpp"

#include <string>
#include <vector>

namespace cascade {
namespace unified {

struct PluginMetadata {
  std::string id{};      ///< Unique plugin id; prefixes its sensor ids
  std::string name{};
  std::string version{};
  std::string author{};
  std::string description{};
};

class Plugin {
public:
  virtual ~Plugin() = default;

  [[nodiscard]] virtual const PluginMetadata& metadata() const noexcept = 0;

  [[nodiscard]] virtual bool init() = 0;
  [[nodiscard]] virtual bool start() = 0;
  virtual void stop() = 0;

  /// Current readings of a started plugin.
  [[nodiscard]] virtual std::vector<RawSensor> poll() = 0;

  virtual void destroy() = 0;
};

} // namespace unified
} // namespace cascade

#endif // CASCADE_UNIFIED_PLUGIN_HPP
