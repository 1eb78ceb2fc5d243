#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace nb::tests {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
  explicit TempDir(std::string_view prefix) {
    static std::atomic<int> counter{0};
    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    path_ = std::filesystem::temp_directory_path() /
            (std::string(prefix) + "-" + std::to_string(now_ms) + "-" + std::to_string(counter++));

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
    if (ec) throw std::runtime_error("failed to create temp root: " + path_.string());
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::string str() const { return path_.string(); }

  // Creates parent directories as needed.
  void writeFile(const std::string& relative, const std::string& content = "") const {
    const auto p = path_ / relative;
    std::filesystem::create_directories(p.parent_path());
    std::ofstream(p) << content;
  }

  void makeDir(const std::string& relative) const {
    std::filesystem::create_directories(path_ / relative);
  }

private:
  std::filesystem::path path_;
};

} // namespace nb::tests
