#pragma once

#include <ferry/provider/provider.hpp>

#include <filesystem>

namespace ferry::provider {

/// A local directory treated as a bucket. Object names are '/'-separated
/// paths relative to `root`.
class filesystem_catalog final : public source_catalog {
 public:
  explicit filesystem_catalog(std::filesystem::path root);

  std::vector<ferry::schema::object_descriptor_t> list(
      std::string_view prefix) override;
  std::unique_ptr<read_stream> open_read(std::string_view name) override;
  void test_connectivity() override;
  std::string describe() const override;

 private:
  std::filesystem::path root_;
};

/// Writes land in `<key>.ferry-part` and are renamed into place on commit.
class filesystem_destination final : public destination_store {
 public:
  explicit filesystem_destination(std::filesystem::path root);

  std::unique_ptr<write_stream> open_write(
      std::string_view key,
      ferry::schema::byte_count_t size) override;
  bool exists(std::string_view key) override;
  std::optional<ferry::schema::object_metadata_t> head(
      std::string_view key) override;
  void test_connectivity() override;
  std::string describe() const override;

 private:
  std::filesystem::path root_;
};

inline constexpr auto kPartialSuffix = std::string_view{".ferry-part"};
inline constexpr auto kProbeName = std::string_view{".ferry-probe"};

}  // namespace ferry::provider
