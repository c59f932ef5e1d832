#ifndef FLOWEXEC_CORE_FS_UTILS_HPP_
#define FLOWEXEC_CORE_FS_UTILS_HPP_

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace flowexec::core {

namespace detail {

// Sibling path used to stage a write before it is renamed into place.
inline std::filesystem::path StagingPathFor(const std::filesystem::path& target) {
  static std::atomic<std::uint64_t> sequence{0};
  std::filesystem::path staging = target;
  staging += ".partial-" + std::to_string(sequence.fetch_add(1U, std::memory_order_relaxed));
  return staging;
}

} // namespace detail

inline bool EnsureParentDirectory(const std::filesystem::path& path, std::string& error) {
  if (path.empty()) {
    error = "path cannot be empty";
    return false;
  }
  if (!path.has_parent_path()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    error = "unable to create directory '" + path.parent_path().string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Readers never observe a half-written `target`: the text is staged in a
// sibling file and renamed over the destination.
inline bool WriteTextFileAtomic(const std::filesystem::path& target, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(target, error)) {
    return false;
  }

  const std::filesystem::path staging = detail::StagingPathFor(target);
  std::ofstream out(staging, std::ios::binary | std::ios::trunc);
  if (!out) {
    error = "unable to open '" + staging.string() + "' for writing";
    return false;
  }
  out << text;
  out.close();

  std::error_code ec;
  if (!out) {
    std::filesystem::remove(staging, ec);
    error = "failed while writing '" + staging.string() + "'";
    return false;
  }

  std::filesystem::rename(staging, target, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove(staging, ec);
    error = "unable to replace '" + target.string() + "': " + reason;
    return false;
  }
  return true;
}

// Reads a whole file. `not_found` distinguishes a missing path from other I/O
// failures so callers can report the two differently.
inline bool ReadTextFile(const std::filesystem::path& input_path, std::string& text,
                         bool& not_found, std::string& error) {
  text.clear();
  not_found = false;

  std::error_code ec;
  if (!std::filesystem::exists(input_path, ec) || ec) {
    not_found = true;
    error = "file not found: " + input_path.string();
    return false;
  }
  if (std::filesystem::is_directory(input_path, ec) || ec) {
    error = "path is a directory, expected a file: " + input_path.string();
    return false;
  }

  std::ifstream input(input_path, std::ios::binary);
  if (!input) {
    error = "unable to open file: " + input_path.string();
    return false;
  }

  text.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading file: " + input_path.string();
    return false;
  }
  return true;
}

} // namespace flowexec::core

#endif // FLOWEXEC_CORE_FS_UTILS_HPP_
