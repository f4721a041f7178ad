#ifndef CASCADE_ALERTS_ALERT_REPOSITORY_HPP
#define CASCADE_ALERTS_ALERT_REPOSITORY_HPP
/**
 * @file AlertRepository.hpp
 * @brief Alert rule set persisted as a JSON array, rewritten atomically.
 *
 * An empty path disables persistence (load yields nothing, save succeeds).
 */

#include "src/alerts/inc/Alert.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace cascade {
namespace alerts {

class AlertRepository {
public:
  AlertRepository() = default;
  explicit AlertRepository(std::filesystem::path path) : path_(std::move(path)) {}

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  /**
   * @brief Read all stored alerts.
   *
   * A missing file is an empty set. Entries that fail to parse or validate
   * are skipped with a warning.
   *
   * @return false only when the file exists but is not a JSON array.
   */
  [[nodiscard]] bool load(std::vector<Alert>& out, std::string* error = nullptr) const;

  /// Replace the stored set (temp file + rename).
  [[nodiscard]] bool save(const std::vector<Alert>& alerts, std::string* error = nullptr) const;

private:
  std::filesystem::path path_{};
};

} // namespace alerts
} // namespace cascade

#endif // CASCADE_ALERTS_ALERT_REPOSITORY_HPP
