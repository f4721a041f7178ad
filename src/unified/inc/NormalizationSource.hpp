#ifndef CASCADE_UNIFIED_NORMALIZATION_SOURCE_HPP
#define CASCADE_UNIFIED_NORMALIZATION_SOURCE_HPP
/**
 * @file NormalizationSource.hpp
 * @brief One independent sensor subsystem feeding the normalizer.
 */

#include "src/unified/inc/UnifiedSensor.hpp"

#include <vector>

namespace cascade {
namespace unified {

class NormalizationSource {
public:
  virtual ~NormalizationSource() = default;

  /// Human-readable name for logs.
  [[nodiscard]] virtual const char* name() const noexcept = 0;

  /// Provenance tag; prefixes every sensor id from this source.
  [[nodiscard]] virtual const char* tag() const noexcept = 0;

  /// False when the subsystem is absent on this host.
  [[nodiscard]] virtual bool available() = 0;

  /// Current sensors, in the source's own order. May throw.
  [[nodiscard]] virtual std::vector<RawSensor> read() = 0;
};

} // namespace unified
} // namespace cascade

#endif // CASCADE_UNIFIED_NORMALIZATION_SOURCE_HPP
