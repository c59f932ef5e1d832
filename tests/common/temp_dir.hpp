#ifndef FLOWEXEC_TESTS_COMMON_TEMP_DIR_HPP_
#define FLOWEXEC_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace flowexec::tests::common {

// Fresh directory under the system temp dir. Several test cases in one
// process can run within the same millisecond, so the name also carries the
// pid and a per-process sequence number.
inline std::filesystem::path CreateUniqueTempDir(std::string_view prefix) {
  static std::atomic<unsigned> sequence{0};
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
#if defined(_WIN32)
  const long pid = 0;
#else
  const long pid = static_cast<long>(::getpid());
#endif
  const std::filesystem::path root =
      std::filesystem::temp_directory_path() /
      (std::string(prefix) + "-" + std::to_string(pid) + "-" + std::to_string(now_ms) + "-" +
       std::to_string(sequence.fetch_add(1)));

  std::error_code ec;
  std::filesystem::create_directories(root, ec);
  if (ec) {
    Fail("failed to create temp root: " + root.string());
  }
  return root;
}

inline void RemovePathBestEffort(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
}

// Writes `text` to `path`, creating parent directories as needed.
inline void WriteTextFile(const std::filesystem::path& path, std::string_view text) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    Fail("failed to open fixture file for writing: " + path.string());
  }
  out << text;
}

} // namespace flowexec::tests::common

#endif // FLOWEXEC_TESTS_COMMON_TEMP_DIR_HPP_
