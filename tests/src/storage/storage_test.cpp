#include <ferry/storage/file/storage.hpp>
#include <ferry/testing/common.hpp>
#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <sys/stat.h>
#include <system_error>

namespace {

using storage_t = ferry::storage::storage<ferry::storage::file_storage_tag>;

storage_t make_store(const std::filesystem::path& path) {
  return ferry::storage::make_storage<ferry::storage::file_storage_tag>(path);
}

}  // namespace

TEST(storage, missing_document_loads_as_nullopt) {
  auto dir = ferry::testing::temp_directory{"ferry_storage_missing"};
  auto store = make_store(dir.path / "state.json");
  EXPECT_FALSE(store.load().has_value());
}

TEST(storage, replace_then_load_returns_document) {
  auto dir = ferry::testing::temp_directory{"ferry_storage_replace"};
  auto store = make_store(dir.path / "nested" / "state.json");
  store.replace("{\"version\": \"1.0\"}");
  auto loaded = store.load();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, "{\"version\": \"1.0\"}");
  EXPECT_FALSE(std::filesystem::exists(store.staging_path()));
}

TEST(storage, document_is_owner_read_write_only) {
  auto dir = ferry::testing::temp_directory{"ferry_storage_mode"};
  auto store = make_store(dir.path / "state.json");
  store.replace("{}");

  struct stat info {};
  ASSERT_EQ(::stat(store.path.c_str(), &info), 0);
  EXPECT_EQ(info.st_mode & 0777, 0600u);
}

TEST(storage, staged_document_is_invisible_until_commit) {
  auto dir = ferry::testing::temp_directory{"ferry_storage_staged"};
  auto store = make_store(dir.path / "state.json");
  store.replace("previous");

  // A crash between the staging write and the rename leaves the live
  // document untouched.
  store.stage("next");
  EXPECT_EQ(store.load(), std::optional<std::string>{"previous"});
  EXPECT_TRUE(std::filesystem::exists(store.staging_path()));

  store.commit_staged();
  EXPECT_EQ(store.load(), std::optional<std::string>{"next"});
  EXPECT_FALSE(std::filesystem::exists(store.staging_path()));
}

TEST(storage, replace_overwrites_stale_staging_file) {
  auto dir = ferry::testing::temp_directory{"ferry_storage_stale"};
  auto store = make_store(dir.path / "state.json");
  ferry::testing::write_file(store.staging_path(),
                             "leftover from an interrupted run with more "
                             "bytes than the new document");
  store.replace("fresh");
  EXPECT_EQ(store.load(), std::optional<std::string>{"fresh"});
}

TEST(storage, unwritable_directory_throws_system_error) {
  auto dir = ferry::testing::temp_directory{"ferry_storage_blocked"};
  // A regular file where the parent directory should be.
  ferry::testing::write_file(dir.path / "blocker", "x");
  auto store = make_store(dir.path / "blocker" / "state.json");
  EXPECT_THROW(store.replace("{}"), std::system_error);
}
