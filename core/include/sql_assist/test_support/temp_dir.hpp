// sql_assist/test_support/temp_dir.hpp - scratch directories for tests
#pragma once

#include <filesystem>
#include <fstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace sql_assist::test_support
{

/// Directory under the system temp path, removed with its contents on scope exit.
struct TempDir
{
  std::filesystem::path path;

  explicit TempDir(std::string_view name)
  : path(std::filesystem::temp_directory_path() / std::filesystem::path(name))
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  /// Write `content` to `relative` below the directory and return its full path.
  std::filesystem::path write(const std::filesystem::path & relative, std::string_view content) const
  {
    const auto full = path / relative;
    std::filesystem::create_directories(full.parent_path());
    std::ofstream out(full, std::ios::binary);
    out << content;
    return full;
  }
};

}  // namespace sql_assist::test_support
