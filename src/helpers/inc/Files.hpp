#ifndef CASCADE_HELPERS_FILES_HPP
#define CASCADE_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief procfs/sysfs read helpers and atomic file replacement.
 *
 * Readers never throw: a missing or unreadable file yields an empty string or
 * the supplied default, which is how most sysfs attributes are read.
 */

#include "src/helpers/inc/Strings.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>     // std::rename
#include <filesystem> // std::filesystem
#include <fstream>    // std::ifstream, std::ofstream
#include <sstream>    // std::ostringstream
#include <string>
#include <system_error>
#include <vector>

namespace cascade {
namespace helpers {
namespace files {

namespace fs = std::filesystem;

/* ----------------------------- Reading ----------------------------- */

/// Whole file as a string; empty on failure.
[[nodiscard]] inline std::string readFile(const fs::path& path) noexcept {
  try {
    std::ifstream file(path);
    if (!file) {
      return {};
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
  } catch (const std::exception&) {
    return {};
  }
}

/// First line of a file, trailing whitespace removed; empty on failure.
[[nodiscard]] inline std::string readLine(const fs::path& path) noexcept {
  try {
    std::ifstream file(path);
    if (!file) {
      return {};
    }
    std::string line;
    std::getline(file, line);
    return std::string(strings::trim(line));
  } catch (const std::exception&) {
    return {};
  }
}

/// Integer attribute (e.g. temp1_input); defaultVal on failure.
[[nodiscard]] inline std::int64_t readInt64(const fs::path& path,
                                            std::int64_t defaultVal = -1) noexcept {
  try {
    return strings::parseInt64(readLine(path)).value_or(defaultVal);
  } catch (const std::exception&) {
    return defaultVal;
  }
}

/// True if path exists (errors treated as absent).
[[nodiscard]] inline bool pathExists(const fs::path& path) noexcept {
  std::error_code ec;
  return fs::exists(path, ec);
}

/**
 * @brief Entries of dir whose filename starts with prefix, sorted by name.
 *
 * Sorting keeps read order stable across calls (directory_iterator order is
 * unspecified).
 */
[[nodiscard]] inline std::vector<fs::path> listDir(const fs::path& dir,
                                                   std::string_view prefix = {}) noexcept {
  std::vector<fs::path> out;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return out;
  }
  try {
    for (const auto& ENTRY : fs::directory_iterator(dir, ec)) {
      const std::string NAME = ENTRY.path().filename().string();
      if (strings::startsWith(NAME, prefix)) {
        out.push_back(ENTRY.path());
      }
    }
    std::sort(out.begin(), out.end());
  } catch (const std::exception&) {
    out.clear();
  }
  return out;
}

/* ----------------------------- Writing ----------------------------- */

/**
 * @brief Replace path with content via a temporary file and rename.
 *
 * Readers observe either the old or the new document, never a partial one.
 * Parent directories are created as needed.
 *
 * @param error Receives a message on failure (optional).
 * @return true on success.
 */
[[nodiscard]] inline bool writeFileAtomic(const fs::path& path, const std::string& content,
                                          std::string* error = nullptr) noexcept {
  try {
    std::error_code ec;
    if (path.has_parent_path()) {
      fs::create_directories(path.parent_path(), ec);
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
      std::ofstream out(tmp, std::ios::trunc);
      if (!out) {
        if (error != nullptr) {
          *error = "cannot open " + tmp.string() + " for writing";
        }
        return false;
      }
      out << content;
      out.flush();
      if (!out) {
        if (error != nullptr) {
          *error = "short write to " + tmp.string();
        }
        return false;
      }
    }

    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
      if (error != nullptr) {
        *error = "cannot rename " + tmp.string() + " to " + path.string();
      }
      fs::remove(tmp, ec);
      return false;
    }
    return true;
  } catch (const std::exception& e) {
    if (error != nullptr) {
      *error = e.what();
    }
    return false;
  }
}

} // namespace files
} // namespace helpers
} // namespace cascade

#endif // CASCADE_HELPERS_FILES_HPP
