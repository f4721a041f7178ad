/**
 * @file MonitorSettings.cpp
 */

#include "src/snapshot/inc/MonitorSettings.hpp"

namespace cascade {
namespace snapshot {

/* ----------------------------- Category ----------------------------- */

const char* toString(Category category) noexcept {
  switch (category) {
  case Category::Cpu:
    return "cpu";
  case Category::Gpu:
    return "gpu";
  case Category::Memory:
    return "memory";
  case Category::Disk:
    return "disk";
  case Category::Network:
    return "network";
  }
  return "unknown";
}

std::optional<Category> parseCategory(std::string_view name) noexcept {
  if (name == "cpu") {
    return Category::Cpu;
  }
  if (name == "gpu" || name == "gpus") {
    return Category::Gpu;
  }
  if (name == "memory") {
    return Category::Memory;
  }
  if (name == "disk" || name == "disks") {
    return Category::Disk;
  }
  if (name == "network") {
    return Category::Network;
  }
  return std::nullopt;
}

/* ----------------------------- EnabledSet ----------------------------- */

std::vector<std::string> EnabledSet::names() const {
  std::vector<std::string> out;
  for (const Category C : ALL_CATEGORIES) {
    if (test(C)) {
      out.emplace_back(toString(C));
    }
  }
  return out;
}

std::optional<EnabledSet> EnabledSet::fromNames(const std::vector<std::string>& names,
                                                std::string* error) {
  EnabledSet set{};
  set.flags.fill(false);
  for (const std::string& NAME : names) {
    const std::optional<Category> C = parseCategory(NAME);
    if (!C) {
      if (error != nullptr) {
        *error = "unknown sensor category '" + NAME + "'";
      }
      return std::nullopt;
    }
    set.set(*C, true);
  }
  return set;
}

/* ----------------------------- MonitorSettings ----------------------------- */

EnabledSet MonitorSettings::enabled() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return enabled_;
}

bool MonitorSettings::isEnabled(Category category) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return enabled_.test(category);
}

void MonitorSettings::setEnabled(Category category, bool on) {
  std::lock_guard<std::mutex> lock(mtx_);
  enabled_.set(category, on);
}

void MonitorSettings::replace(const EnabledSet& set) {
  std::lock_guard<std::mutex> lock(mtx_);
  enabled_ = set;
}

} // namespace snapshot
} // namespace cascade
