/**
 * @file AlertRepository.cpp
 * @brief JSON file persistence for alert rules.
 */

#include "src/alerts/inc/AlertRepository.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Json.hpp"
#include "src/helpers/inc/Log.hpp"

#include <fmt/format.h>

namespace cascade {
namespace alerts {

namespace {
constexpr const char* LOG_CAT = "alerts";
}

bool AlertRepository::load(std::vector<Alert>& out, std::string* error) const {
  out.clear();
  if (path_.empty() || !helpers::files::pathExists(path_)) {
    return true;
  }

  Json::Value doc;
  if (!helpers::json::loadFile(path_, doc, error)) {
    return false;
  }
  if (!doc.isArray()) {
    if (error != nullptr) {
      *error = fmt::format("{}: expected a JSON array", path_.string());
    }
    return false;
  }

  for (Json::ArrayIndex i = 0; i < doc.size(); ++i) {
    Alert alert{};
    std::string why;
    bool ok = false;
    try {
      ok = fromJson(doc[i], alert, &why) && validate(alert, &why);
    } catch (const Json::Exception& e) {
      why = e.what();
    }
    if (!ok) {
      helpers::log::warn(LOG_CAT, "{}: skipping entry {}: {}", path_.string(), i, why);
      continue;
    }
    if (alert.id.empty()) {
      alert.id = generateId();
    }
    out.push_back(std::move(alert));
  }
  return true;
}

bool AlertRepository::save(const std::vector<Alert>& alerts, std::string* error) const {
  if (path_.empty()) {
    return true;
  }
  Json::Value doc(Json::arrayValue);
  for (const Alert& A : alerts) {
    doc.append(toJson(A));
  }
  return helpers::json::saveFile(path_, doc, error);
}

} // namespace alerts
} // namespace cascade
