/**
 * @file UnifiedNormalizer.cpp
 * @brief Fan-out over normalization sources.
 */

#include "src/unified/inc/UnifiedNormalizer.hpp"
#include "src/helpers/inc/Log.hpp"

#include <cmath>
#include <exception>
#include <future>
#include <utility>

namespace cascade {
namespace unified {

namespace {

constexpr const char* LOG_CAT = "unified";

/// Sensors of one source; nullopt when the source is unavailable or failed.
using PendingRead = std::future<std::optional<std::vector<RawSensor>>>;

PendingRead launch(NormalizationSource* source) {
  return std::async(std::launch::async, [source]() -> std::optional<std::vector<RawSensor>> {
    try {
      if (!source->available()) {
        helpers::log::debug(LOG_CAT, "source '{}' unavailable", source->name());
        return std::nullopt;
      }
      return source->read();
    } catch (const std::exception& e) {
      helpers::log::warn(LOG_CAT, "source '{}' failed: {}", source->name(), e.what());
      return std::nullopt;
    }
  });
}

} // namespace

UnifiedNormalizer::UnifiedNormalizer(helpers::clock::ClockFn clock) : clock_(std::move(clock)) {}

void UnifiedNormalizer::addSource(std::shared_ptr<NormalizationSource> source) {
  if (source) {
    sources_.push_back(std::move(source));
  }
}

UnifiedData UnifiedNormalizer::merge() {
  std::vector<PendingRead> pending;
  pending.reserve(sources_.size());
  for (const auto& SRC : sources_) {
    pending.push_back(launch(SRC.get()));
  }

  UnifiedData data{};
  for (std::size_t i = 0; i < sources_.size(); ++i) {
    NormalizationSource& src = *sources_[i];
    SourceState state{src.name(), src.tag(), false, 0};

    std::optional<std::vector<RawSensor>> raw = pending[i].get();
    if (raw) {
      state.available = true;
      for (const RawSensor& R : *raw) {
        if (!std::isfinite(R.value)) {
          helpers::log::debug(LOG_CAT, "{}: sensor '{}' has no usable value", src.tag(), R.id);
          continue;
        }
        data.sensors.push_back(normalize(R, src.tag()));
        ++state.sensorCount;
      }
    }
    data.sources.push_back(std::move(state));
  }
  data.timestamp = clock_();

  std::lock_guard<std::mutex> lock(lastMtx_);
  last_ = data;
  return data;
}

std::optional<UnifiedData> UnifiedNormalizer::last() const {
  std::lock_guard<std::mutex> lock(lastMtx_);
  return last_;
}

} // namespace unified
} // namespace cascade
