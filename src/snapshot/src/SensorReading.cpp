/**
 * @file SensorReading.cpp
 */

#include "src/snapshot/inc/SensorReading.hpp"

#include <fmt/format.h>

namespace cascade {
namespace snapshot {

const char* toString(ReadingType type) noexcept {
  switch (type) {
  case ReadingType::Temperature:
    return "temperature";
  case ReadingType::Voltage:
    return "voltage";
  case ReadingType::Fan:
    return "fan";
  case ReadingType::Power:
    return "power";
  case ReadingType::Load:
    return "load";
  case ReadingType::Clock:
    return "clock";
  case ReadingType::Data:
    return "data";
  }
  return "data";
}

std::string SensorReading::toString() const {
  return fmt::format("{:<24} {:>9.2f} {:<3} [{} .. {}] {}", source, value, unit, min, max,
                     snapshot::toString(type));
}

} // namespace snapshot
} // namespace cascade
