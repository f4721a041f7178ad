#ifndef CASCADE_SOURCES_LINUX_ADAPTERS_HPP
#define CASCADE_SOURCES_LINUX_ADAPTERS_HPP
/**
 * @file LinuxAdapters.hpp
 * @brief Adapter set backed by the procfs/sysfs sources.
 */

#include "src/snapshot/inc/CategoryAdapter.hpp"

#include <filesystem>

namespace cascade {
namespace sources {

/// One source per category, all reading under root.
[[nodiscard]] snapshot::AdapterSet makeLinuxAdapters(const std::filesystem::path& root = "/");

} // namespace sources
} // namespace cascade

#endif // CASCADE_SOURCES_LINUX_ADAPTERS_HPP
