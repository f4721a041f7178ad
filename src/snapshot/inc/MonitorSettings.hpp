#ifndef CASCADE_SNAPSHOT_MONITOR_SETTINGS_HPP
#define CASCADE_SNAPSHOT_MONITOR_SETTINGS_HPP
/**
 * @file MonitorSettings.hpp
 * @brief Hardware categories and the runtime set of enabled ones.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cascade {
namespace snapshot {

/* ----------------------------- Category ----------------------------- */

enum class Category : std::uint8_t { Cpu = 0, Gpu = 1, Memory = 2, Disk = 3, Network = 4 };

inline constexpr std::size_t CATEGORY_COUNT = 5;

/// All categories in snapshot order.
inline constexpr std::array<Category, CATEGORY_COUNT> ALL_CATEGORIES{
    Category::Cpu, Category::Gpu, Category::Memory, Category::Disk, Category::Network};

/// Lower-case name ("cpu", "gpu", "memory", "disk", "network").
[[nodiscard]] const char* toString(Category category) noexcept;

/// Parse a category name; accepts the plural forms "disks" and "gpus".
[[nodiscard]] std::optional<Category> parseCategory(std::string_view name) noexcept;

/* ----------------------------- EnabledSet ----------------------------- */

/// Value type: which categories are collected.
struct EnabledSet {
  std::array<bool, CATEGORY_COUNT> flags{true, true, true, true, true};

  [[nodiscard]] bool test(Category c) const noexcept {
    return flags[static_cast<std::size_t>(c)];
  }
  void set(Category c, bool on) noexcept { flags[static_cast<std::size_t>(c)] = on; }

  /// Names of enabled categories in snapshot order.
  [[nodiscard]] std::vector<std::string> names() const;

  /**
   * @brief Build from category names; unknown names fail.
   * @param error Receives the offending name (optional).
   */
  [[nodiscard]] static std::optional<EnabledSet> fromNames(const std::vector<std::string>& names,
                                                           std::string* error = nullptr);

  bool operator==(const EnabledSet& other) const = default;
};

/* ----------------------------- MonitorSettings ----------------------------- */

/**
 * @brief Shared, mutable enabled-category set.
 *
 * The composer takes a copy at the start of each cycle, so a change applies
 * from the next cycle on.
 *
 * @note Thread-safe.
 */
class MonitorSettings {
public:
  MonitorSettings() = default;
  explicit MonitorSettings(const EnabledSet& initial) : enabled_(initial) {}

  [[nodiscard]] EnabledSet enabled() const;
  [[nodiscard]] bool isEnabled(Category category) const;
  void setEnabled(Category category, bool on);
  void replace(const EnabledSet& set);

private:
  mutable std::mutex mtx_;
  EnabledSet enabled_{};
};

} // namespace snapshot
} // namespace cascade

#endif // CASCADE_SNAPSHOT_MONITOR_SETTINGS_HPP
