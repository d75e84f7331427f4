#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::storage {

template <typename Library>
struct storage {
  /// Return the persisted document, or std::nullopt when none exists yet.
  std::optional<std::string> load() const;

  /// Write the document next to the live one without making it visible.
  void stage(const std::string_view& document) const;

  /// Atomically publish the staged document over the live one.
  void commit_staged() const;

  /// stage() followed by commit_staged().
  void replace(const std::string_view& document) const;
};

/// Construct a concrete storage backend for the document at `path`.
template <typename Library>
storage<Library> make_storage(const std::filesystem::path& path);

}  // namespace ferry::storage
