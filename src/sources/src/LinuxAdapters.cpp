/**
 * @file LinuxAdapters.cpp
 */

#include "src/sources/inc/LinuxAdapters.hpp"
#include "src/sources/inc/CpuSource.hpp"
#include "src/sources/inc/DiskSource.hpp"
#include "src/sources/inc/GpuSource.hpp"
#include "src/sources/inc/MemorySource.hpp"
#include "src/sources/inc/NetworkSource.hpp"

#include <memory>

namespace cascade {
namespace sources {

snapshot::AdapterSet makeLinuxAdapters(const std::filesystem::path& root) {
  snapshot::AdapterSet set;
  set.cpu = std::make_unique<CpuSource>(root);
  set.gpu = std::make_unique<GpuSource>(root);
  set.memory = std::make_unique<MemorySource>(root);
  set.disk = std::make_unique<DiskSource>(root);
  set.network = std::make_unique<NetworkSource>(root);
  return set;
}

} // namespace sources
} // namespace cascade
