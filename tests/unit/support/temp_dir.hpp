#pragma once

#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <system_error>

namespace dappvault::test {

// Unique directory under the system temp dir, removed on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(const std::string& tag) {
    const auto suffix = static_cast<std::uint64_t>(std::random_device{}()) << 16 |
                        static_cast<std::uint64_t>(std::random_device{}() & 0xFFFF);
    path_ = std::filesystem::temp_directory_path() /
            ("dappvault_" + tag + "_" + std::to_string(suffix));
    std::filesystem::create_directories(path_);
  }
  ~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace dappvault::test
