#pragma once

/** \file temp_dir.hpp
 *  \brief Scoped unique directory under the system temp path for tests.
 */

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

namespace vectra::test {

class TempDir {
public:
  explicit TempDir(const std::string& prefix) {
    static std::atomic<unsigned> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  auto path() const -> const std::filesystem::path& { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace vectra::test
