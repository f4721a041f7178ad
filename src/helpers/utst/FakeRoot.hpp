#ifndef CASCADE_HELPERS_UTST_FAKE_ROOT_HPP
#define CASCADE_HELPERS_UTST_FAKE_ROOT_HPP
/**
 * @file FakeRoot.hpp
 * @brief Temporary filesystem tree standing in for / in source tests.
 */

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h> // getpid

namespace cascade {
namespace testing {

class FakeRoot {
public:
  FakeRoot() {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("cascade_root_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
  }

  ~FakeRoot() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  FakeRoot(const FakeRoot&) = delete;
  FakeRoot& operator=(const FakeRoot&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  /// Create rel (and parents) with content.
  void write(const std::string& rel, const std::string& content) const {
    const std::filesystem::path P = path_ / rel;
    std::filesystem::create_directories(P.parent_path());
    std::ofstream out(P, std::ios::trunc);
    out << content;
  }

  void mkdir(const std::string& rel) const { std::filesystem::create_directories(path_ / rel); }

private:
  std::filesystem::path path_;
};

} // namespace testing
} // namespace cascade

#endif // CASCADE_HELPERS_UTST_FAKE_ROOT_HPP
