#pragma once
#include <ferry/storage/storage.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace ferry::storage {

struct file_storage_tag {};

/// Single-document storage backed by one file.
///
/// Writes go to `<path>.tmp` in the same directory and are published with
/// rename(2), so readers only ever see a complete document. Failures throw
/// std::system_error.
template <>
struct storage<file_storage_tag> final {
  std::filesystem::path path;
  mode_t mode{0600};

  std::optional<std::string> load() const;
  void stage(const std::string_view& document) const;
  void commit_staged() const;
  void replace(const std::string_view& document) const;

  std::filesystem::path staging_path() const;
};

template <>
storage<file_storage_tag> make_storage<file_storage_tag>(
    const std::filesystem::path& path);

}  // namespace ferry::storage
