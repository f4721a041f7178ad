#ifndef CASCADE_HELPERS_JSON_HPP
#define CASCADE_HELPERS_JSON_HPP
/**
 * @file Json.hpp
 * @brief jsoncpp wrappers: parse, serialize, file load/save, optional fields.
 */

#include "src/helpers/inc/Files.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <json/json.h>

namespace cascade {
namespace helpers {
namespace json {

/* ----------------------------- Text ----------------------------- */

/**
 * @brief Parse a JSON document.
 * @param error Receives the parser message on failure (optional).
 * @return true on success; out is unspecified on failure.
 */
[[nodiscard]] inline bool parse(std::string_view text, Json::Value& out,
                                std::string* error = nullptr) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  const std::unique_ptr<Json::CharReader> READER(builder.newCharReader());
  std::string errs;
  if (!READER->parse(text.data(), text.data() + text.size(), &out, &errs)) {
    if (error != nullptr) {
      *error = errs.empty() ? "invalid JSON" : errs;
    }
    return false;
  }
  return true;
}

/// Single-line serialization (wire frames).
[[nodiscard]] inline std::string dumpCompact(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

/// Indented serialization (persisted documents, CLI output).
[[nodiscard]] inline std::string dumpPretty(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

/* ----------------------------- Files ----------------------------- */

/**
 * @brief Load and parse a JSON file.
 * @return false if the file is missing, unreadable or malformed.
 */
[[nodiscard]] inline bool loadFile(const std::filesystem::path& path, Json::Value& out,
                                   std::string* error = nullptr) {
  if (!files::pathExists(path)) {
    if (error != nullptr) {
      *error = "no such file: " + path.string();
    }
    return false;
  }
  const std::string TEXT = files::readFile(path);
  std::string perr;
  if (!parse(TEXT, out, &perr)) {
    if (error != nullptr) {
      *error = path.string() + ": " + perr;
    }
    return false;
  }
  return true;
}

/// Serialize and atomically replace path.
[[nodiscard]] inline bool saveFile(const std::filesystem::path& path, const Json::Value& value,
                                   std::string* error = nullptr) {
  return files::writeFileAtomic(path, dumpPretty(value) + "\n", error);
}

/* ----------------------------- Fields ----------------------------- */

/// Numeric member or nullopt when absent/null/non-numeric.
[[nodiscard]] inline std::optional<double> optDouble(const Json::Value& obj, const char* key) {
  if (!obj.isObject() || !obj.isMember(key) || !obj[key].isNumeric()) {
    return std::nullopt;
  }
  return obj[key].asDouble();
}

/// Integer member or nullopt when absent/null/non-integral/outside int64.
[[nodiscard]] inline std::optional<std::int64_t> optInt64(const Json::Value& obj,
                                                          const char* key) {
  if (!obj.isObject() || !obj.isMember(key) || !obj[key].isInt64()) {
    return std::nullopt;
  }
  return obj[key].asInt64();
}

/// Optional number as JSON (null when absent).
[[nodiscard]] inline Json::Value fromOptional(const std::optional<double>& value) {
  return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

/// Optional integer as JSON (null when absent).
[[nodiscard]] inline Json::Value fromOptional(const std::optional<std::int64_t>& value) {
  return value ? Json::Value(static_cast<Json::Int64>(*value)) : Json::Value(Json::nullValue);
}

} // namespace json
} // namespace helpers
} // namespace cascade

#endif // CASCADE_HELPERS_JSON_HPP
