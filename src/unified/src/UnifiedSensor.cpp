/**
 * @file UnifiedSensor.cpp
 * @brief Type table, status derivation and JSON for unified sensors.
 */

#include "src/unified/inc/UnifiedSensor.hpp"
#include "src/helpers/inc/Json.hpp"

#include <array>
#include <cmath>
#include <utility>

#include <fmt/format.h>

namespace cascade {
namespace unified {

namespace {

struct TypeEntry {
  std::string_view label;
  SensorType type;
};

constexpr std::array<TypeEntry, 13> TYPE_TABLE{{
    {"temperature", SensorType::Temperature},
    {"voltage", SensorType::Voltage},
    {"fan", SensorType::Fan},
    {"power", SensorType::Power},
    {"clock", SensorType::Clock},
    {"load", SensorType::Load},
    {"current", SensorType::Current},
    {"level", SensorType::Load},
    {"usage", SensorType::Load},
    {"data", SensorType::Other},
    {"throughput", SensorType::Other},
    {"humidity", SensorType::Other},
    {"intrusion", SensorType::Other},
}};

Status temperatureStatus(double value, std::optional<double> max) noexcept {
  if (max && *max > 0.0) {
    const double RATIO = value / *max;
    if (RATIO >= TEMP_CRIT_RATIO) {
      return Status::Critical;
    }
    if (RATIO >= TEMP_WARN_RATIO) {
      return Status::Warning;
    }
    return Status::Ok;
  }
  if (value >= TEMP_CRIT_ABS) {
    return Status::Critical;
  }
  if (value >= TEMP_WARN_ABS) {
    return Status::Warning;
  }
  return Status::Ok;
}

Status voltageStatus(double value, std::optional<double> max,
                     std::optional<double> nominal) noexcept {
  const std::optional<double> REF = nominal ? nominal : max;
  if (!REF || *REF == 0.0) {
    return Status::Ok;
  }
  const double DEVIATION = std::fabs(1.0 - value / *REF);
  if (DEVIATION > VOLT_CRIT_DEVIATION) {
    return Status::Critical;
  }
  if (DEVIATION > VOLT_WARN_DEVIATION) {
    return Status::Warning;
  }
  return Status::Ok;
}

Json::Value sensorArray(const std::vector<UnifiedSensor>& sensors) {
  Json::Value arr(Json::arrayValue);
  for (const UnifiedSensor& S : sensors) {
    arr.append(toJson(S));
  }
  return arr;
}

} // namespace

/* ----------------------------- Enums ----------------------------- */

const char* toString(SensorType type) noexcept {
  switch (type) {
  case SensorType::Temperature:
    return "temperature";
  case SensorType::Voltage:
    return "voltage";
  case SensorType::Fan:
    return "fan";
  case SensorType::Power:
    return "power";
  case SensorType::Clock:
    return "clock";
  case SensorType::Load:
    return "load";
  case SensorType::Current:
    return "current";
  case SensorType::Other:
    return "other";
  }
  return "other";
}

const char* toString(Status status) noexcept {
  switch (status) {
  case Status::Ok:
    return "ok";
  case Status::Warning:
    return "warning";
  case Status::Critical:
    return "critical";
  }
  return "ok";
}

SensorType mapType(std::string_view label) noexcept {
  for (const TypeEntry& E : TYPE_TABLE) {
    if (E.label == label) {
      return E.type;
    }
  }
  return SensorType::Other;
}

/* ----------------------------- Status ----------------------------- */

Status deriveStatus(SensorType type, double value, std::optional<double> max,
                    std::optional<double> nominal, bool alarm) noexcept {
  if (alarm) {
    return Status::Critical;
  }
  switch (type) {
  case SensorType::Temperature:
    return temperatureStatus(value, max);
  case SensorType::Voltage:
    return voltageStatus(value, max, nominal);
  case SensorType::Fan:
    if (max && value < FAN_STALL_RPM && *max > FAN_FAST_MAX_RPM) {
      return Status::Warning;
    }
    return Status::Ok;
  default:
    return Status::Ok;
  }
}

/* ----------------------------- UnifiedSensor ----------------------------- */

std::string UnifiedSensor::toString() const {
  return fmt::format("{} {}={:.2f} {} [{}]", id, name, value, unit, unified::toString(status));
}

UnifiedSensor normalize(const RawSensor& raw, std::string_view tag) {
  UnifiedSensor out{};
  out.id = fmt::format("{}-{}", tag, raw.id);
  out.name = raw.name;
  out.type = mapType(raw.typeLabel);
  out.value = raw.value;
  out.min = raw.min;
  out.max = raw.max;
  out.unit = raw.unit;
  out.source = std::string(tag);
  out.hardware = raw.hardware;
  out.status = raw.reportedStatus
                   ? *raw.reportedStatus
                   : deriveStatus(out.type, raw.value, raw.max, raw.nominal, raw.alarm);
  return out;
}

/* ----------------------------- UnifiedData ----------------------------- */

std::vector<UnifiedSensor> UnifiedData::ofType(SensorType type) const {
  std::vector<UnifiedSensor> out;
  for (const UnifiedSensor& S : sensors) {
    if (S.type == type) {
      out.push_back(S);
    }
  }
  return out;
}

std::vector<UnifiedSensor> UnifiedData::criticalSensors() const {
  std::vector<UnifiedSensor> out;
  for (const UnifiedSensor& S : sensors) {
    if (S.status == Status::Critical) {
      out.push_back(S);
    }
  }
  return out;
}

std::vector<UnifiedSensor> UnifiedData::warningSensors() const {
  std::vector<UnifiedSensor> out;
  for (const UnifiedSensor& S : sensors) {
    if (S.status == Status::Warning) {
      out.push_back(S);
    }
  }
  return out;
}

/* ----------------------------- JSON ----------------------------- */

Json::Value toJson(const UnifiedSensor& sensor) {
  Json::Value v(Json::objectValue);
  v["id"] = sensor.id;
  v["name"] = sensor.name;
  v["type"] = toString(sensor.type);
  v["value"] = sensor.value;
  v["min"] = helpers::json::fromOptional(sensor.min);
  v["max"] = helpers::json::fromOptional(sensor.max);
  v["unit"] = sensor.unit;
  v["source"] = sensor.source;
  v["hardware"] = sensor.hardware;
  v["status"] = toString(sensor.status);
  return v;
}

Json::Value toJson(const UnifiedData& data) {
  Json::Value v(Json::objectValue);

  Json::Value sources(Json::objectValue);
  for (const SourceState& S : data.sources) {
    sources[S.tag] = S.available;
  }
  v["sources"] = sources;
  v["sensors"] = sensorArray(data.sensors);
  v["temperatures"] = sensorArray(data.ofType(SensorType::Temperature));
  v["voltages"] = sensorArray(data.ofType(SensorType::Voltage));
  v["fans"] = sensorArray(data.ofType(SensorType::Fan));
  v["powers"] = sensorArray(data.ofType(SensorType::Power));
  v["clocks"] = sensorArray(data.ofType(SensorType::Clock));
  v["loads"] = sensorArray(data.ofType(SensorType::Load));
  v["timestamp"] = static_cast<Json::Int64>(data.timestamp);
  return v;
}

} // namespace unified
} // namespace cascade
