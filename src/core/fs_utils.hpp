#ifndef JSONCOMB_CORE_FS_UTILS_HPP_
#define JSONCOMB_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace jsoncomb::core {

namespace detail {

inline std::filesystem::path BuildTempSibling(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

// Preflight for input documents: the path must name an existing, regular,
// readable file. Emptiness is not checked here; an empty document is a parse
// error, not an I/O error.
inline bool CheckInputFile(const std::filesystem::path& path, std::string& error) {
  if (path.empty()) {
    error = "input path cannot be empty";
    return false;
  }

  std::error_code ec;
  if (!std::filesystem::exists(path, ec) || ec) {
    error = "input file not found: " + path.string();
    return false;
  }
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    error = "input path must point to a regular file: " + path.string();
    return false;
  }
  return true;
}

inline bool ReadTextFile(const std::filesystem::path& path, std::string& text,
                         std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open input file: " + path.string();
    return false;
  }

  text.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading input file: " + path.string();
    return false;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Writes `text` to a temporary sibling and renames it over `output_path`, so a
// reader never observes a half-written rendering. Falls back to remove+rename
// where rename cannot overwrite.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildTempSibling(output_path);
  bool written = false;
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }
    out_file << text;
    out_file.flush();
    written = static_cast<bool>(out_file);
  }
  if (!written) {
    std::error_code cleanup_ec;
    (void)std::filesystem::remove(temp_path, cleanup_ec);
    error = "failed while writing temp output file '" + temp_path.string() + "'";
    return false;
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace jsoncomb::core

#endif // JSONCOMB_CORE_FS_UTILS_HPP_
