#ifndef CASCADE_HELPERS_STRINGS_HPP
#define CASCADE_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief Small string utilities shared by the procfs/sysfs readers and the protocol.
 */

#include <cstdint>
#include <cstdlib> // strtod, strtoll
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cascade {
namespace helpers {
namespace strings {

/* ----------------------------- Inspection ----------------------------- */

/// True if str begins with prefix.
[[nodiscard]] inline bool startsWith(std::string_view str, std::string_view prefix) noexcept {
  return str.substr(0, prefix.size()) == prefix;
}

/// True if str ends with suffix.
[[nodiscard]] inline bool endsWith(std::string_view str, std::string_view suffix) noexcept {
  return str.size() >= suffix.size() && str.substr(str.size() - suffix.size()) == suffix;
}

/* ----------------------------- Manipulation ----------------------------- */

/// Strip leading and trailing spaces, tabs, CR and LF.
[[nodiscard]] inline std::string_view trim(std::string_view str) noexcept {
  constexpr std::string_view WS = " \t\r\n";
  const std::size_t BEGIN = str.find_first_not_of(WS);
  if (BEGIN == std::string_view::npos) {
    return {};
  }
  const std::size_t END = str.find_last_not_of(WS);
  return str.substr(BEGIN, END - BEGIN + 1);
}

/**
 * @brief Split on whitespace runs.
 * @note Allocates the result vector; views reference str.
 */
[[nodiscard]] inline std::vector<std::string_view> splitWhitespace(std::string_view str) {
  std::vector<std::string_view> out;
  std::size_t pos = 0;
  while (pos < str.size()) {
    while (pos < str.size() && (str[pos] == ' ' || str[pos] == '\t')) {
      ++pos;
    }
    const std::size_t START = pos;
    while (pos < str.size() && str[pos] != ' ' && str[pos] != '\t') {
      ++pos;
    }
    if (pos > START) {
      out.push_back(str.substr(START, pos - START));
    }
  }
  return out;
}

/* ----------------------------- Parsing ----------------------------- */

/// Parse a decimal floating-point value; nullopt if no digits were consumed.
[[nodiscard]] inline std::optional<double> parseDouble(std::string_view str) {
  const std::string BUF(trim(str));
  if (BUF.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const double VAL = std::strtod(BUF.c_str(), &end);
  if (end == BUF.c_str()) {
    return std::nullopt;
  }
  return VAL;
}

/// Parse a signed 64-bit integer; nullopt if no digits were consumed.
[[nodiscard]] inline std::optional<std::int64_t> parseInt64(std::string_view str) {
  const std::string BUF(trim(str));
  if (BUF.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const long long VAL = std::strtoll(BUF.c_str(), &end, 10);
  if (end == BUF.c_str()) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(VAL);
}

} // namespace strings
} // namespace helpers
} // namespace cascade

#endif // CASCADE_HELPERS_STRINGS_HPP
