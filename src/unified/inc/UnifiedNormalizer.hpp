#ifndef CASCADE_UNIFIED_UNIFIED_NORMALIZER_HPP
#define CASCADE_UNIFIED_UNIFIED_NORMALIZER_HPP
/**
 * @file UnifiedNormalizer.hpp
 * @brief Concurrent merge of every registered NormalizationSource.
 *
 * Sources are queried in parallel. A source that is unavailable or throws
 * contributes no sensors and never fails the merge. Output keeps sources in
 * registration order and sensors in source order; sensors reported by more
 * than one source are kept as separate entries.
 *
 * @note Register sources before the first merge; merge() itself is thread-safe.
 */

#include "src/helpers/inc/Clock.hpp"
#include "src/unified/inc/NormalizationSource.hpp"
#include "src/unified/inc/UnifiedSensor.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace cascade {
namespace unified {

class UnifiedNormalizer {
public:
  explicit UnifiedNormalizer(helpers::clock::ClockFn clock = helpers::clock::systemClock());

  void addSource(std::shared_ptr<NormalizationSource> source);

  [[nodiscard]] std::size_t sourceCount() const noexcept { return sources_.size(); }

  /// Query every source and fuse the results. Also caches the result.
  [[nodiscard]] UnifiedData merge();

  /// Alias for merge().
  [[nodiscard]] UnifiedData collect() { return merge(); }

  /// Result of the most recent merge, if any.
  [[nodiscard]] std::optional<UnifiedData> last() const;

private:
  std::vector<std::shared_ptr<NormalizationSource>> sources_;
  helpers::clock::ClockFn clock_;

  mutable std::mutex lastMtx_;
  std::optional<UnifiedData> last_{};
};

} // namespace unified
} // namespace cascade

#endif // CASCADE_UNIFIED_UNIFIED_NORMALIZER_HPP
