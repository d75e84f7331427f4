#include <ferry/schema/encoding/json/encoder.hpp>
#include <ferry/state/state_store.hpp>
#include <ferry/storage/file/storage.hpp>
#include <ferry/testing/common.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace {

using ferry::testing::at;

struct state_fixture {
  ferry::testing::temp_directory dir{"ferry_state"};
  std::unique_ptr<ferry::common::context> context =
      ferry::testing::make_test_context();
  ferry::testing::manual_clock clock;

  std::filesystem::path file() const { return dir.path / "state.json"; }

  ferry::state::state_store make_store() {
    return ferry::state::state_store{*context, file(), clock.fn()};
  }
};

}  // namespace

TEST(state_store, missing_file_starts_empty) {
  auto fixture = state_fixture{};
  auto store = fixture.make_store();
  store.load();
  EXPECT_EQ(store.size(), 0u);
  EXPECT_FALSE(store.stats().last_sync_at.has_value());
}

TEST(state_store, corrupt_file_starts_empty_without_throwing) {
  auto fixture = state_fixture{};
  ferry::testing::write_file(fixture.file(), "{\"files\": [ truncated");
  auto store = fixture.make_store();
  EXPECT_NO_THROW(store.load());
  EXPECT_EQ(store.size(), 0u);
}

TEST(state_store, recorded_transfer_is_durable) {
  auto fixture = state_fixture{};
  {
    auto store = fixture.make_store();
    store.load();
    EXPECT_TRUE(store.record_transferred("src/a.csv.gz", "dst/a.csv.gz", 100,
                                         at(2024, 5, 1), 2.5,
                                         std::string{"abc123"}));
  }

  auto reopened = fixture.make_store();
  reopened.load();
  auto record = reopened.find("dst/a.csv.gz");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->source_name, "src/a.csv.gz");
  EXPECT_EQ(record->size, 100u);
  EXPECT_EQ(record->created_at, at(2024, 5, 1));
  EXPECT_EQ(record->transferred_at, fixture.clock.now);
  EXPECT_EQ(record->checksum, std::optional<std::string>{"abc123"});
  EXPECT_DOUBLE_EQ(record->duration_seconds, 2.5);
}

TEST(state_store, up_to_date_requires_same_size_and_no_newer_source) {
  auto fixture = state_fixture{};
  auto store = fixture.make_store();
  store.load();
  auto created = at(2024, 5, 1, 6);

  EXPECT_FALSE(store.is_up_to_date("k", 10, created));

  store.record_transferred("s", "k", 10, created, 1.0, std::nullopt);
  EXPECT_TRUE(store.is_up_to_date("k", 10, created));
  EXPECT_TRUE(store.is_up_to_date("k", 10, created - std::chrono::hours{1}));
  EXPECT_FALSE(store.is_up_to_date("k", 11, created));
  EXPECT_FALSE(store.is_up_to_date("k", 10, created + std::chrono::seconds{1}));
}

TEST(state_store, record_without_created_at_is_never_up_to_date) {
  auto fixture = state_fixture{};
  auto store = fixture.make_store();
  store.load();
  store.record_transferred("s", "k", 10, std::nullopt, 1.0, std::nullopt);
  EXPECT_FALSE(store.is_up_to_date("k", 10, at(2000, 1, 1)));
}

TEST(state_store, rerecording_overwrites) {
  auto fixture = state_fixture{};
  auto store = fixture.make_store();
  store.load();
  store.record_transferred("s", "k", 10, at(2024, 1, 1), 1.0, std::nullopt);
  fixture.clock.now += std::chrono::hours{1};
  store.record_transferred("s", "k", 20, at(2024, 1, 2), 1.0, std::nullopt);
  EXPECT_EQ(store.size(), 1u);
  EXPECT_EQ(store.find("k")->size, 20u);
  EXPECT_EQ(store.find("k")->transferred_at, fixture.clock.now);
}

TEST(state_store, cleanup_removes_only_expired_records) {
  auto fixture = state_fixture{};
  auto store = fixture.make_store();
  store.load();

  fixture.clock.now = at(2024, 1, 1);
  store.record_transferred("s", "old", 1, std::nullopt, 1.0, std::nullopt);
  fixture.clock.now = at(2024, 1, 25);
  store.record_transferred("s", "recent", 1, std::nullopt, 1.0, std::nullopt);

  fixture.clock.now = at(2024, 2, 5);
  EXPECT_EQ(store.cleanup_expired(std::chrono::days{30}), 1u);
  EXPECT_FALSE(store.find("old").has_value());
  EXPECT_TRUE(store.find("recent").has_value());

  auto reopened = fixture.make_store();
  reopened.load();
  EXPECT_EQ(reopened.size(), 1u);
}

TEST(state_store, zero_retention_never_expires) {
  auto fixture = state_fixture{};
  auto store = fixture.make_store();
  store.load();
  fixture.clock.now = at(2000, 1, 1);
  store.record_transferred("s", "ancient", 1, std::nullopt, 1.0, std::nullopt);
  fixture.clock.now = at(2024, 1, 1);
  EXPECT_EQ(store.cleanup_expired(std::chrono::days{0}), 0u);
  EXPECT_EQ(store.size(), 1u);
}

TEST(state_store, stats_summarize_records_and_last_sync) {
  auto fixture = state_fixture{};
  auto store = fixture.make_store();
  store.load();
  store.record_transferred("s", "a", 100, std::nullopt, 1.0, std::nullopt);
  store.record_transferred("s", "b", 250, std::nullopt, 1.0, std::nullopt);
  store.mark_synced();
  ASSERT_TRUE(store.persist());

  auto reopened = fixture.make_store();
  reopened.load();
  auto summary = reopened.stats();
  EXPECT_EQ(summary.total_files, 2u);
  EXPECT_EQ(summary.total_bytes, 350u);
  EXPECT_EQ(summary.last_sync_at, fixture.clock.now);
}

TEST(state_store, persist_failure_is_reported_and_memory_kept) {
  auto fixture = state_fixture{};
  ferry::testing::write_file(fixture.dir.path / "blocker", "x");
  auto store = ferry::state::state_store{
      *fixture.context, fixture.dir.path / "blocker" / "state.json",
      fixture.clock.fn()};
  store.load();
  EXPECT_FALSE(
      store.record_transferred("s", "k", 1, std::nullopt, 1.0, std::nullopt));
  EXPECT_TRUE(store.find("k").has_value());
  EXPECT_FALSE(store.persist());
}

TEST(state_store, interrupted_persist_keeps_previous_snapshot) {
  auto fixture = state_fixture{};
  {
    auto store = fixture.make_store();
    store.load();
    store.record_transferred("s", "first", 1, std::nullopt, 1.0, std::nullopt);
  }

  // Simulate dying after the temp file was written but before the rename.
  auto storage =
      ferry::storage::make_storage<ferry::storage::file_storage_tag>(
          fixture.file());
  auto snapshot = ferry::schema::state_snapshot_t{};
  snapshot.records.emplace(
      "second", ferry::schema::transfer_record_t{.source_name = "s",
                                                 .destination_key = "second",
                                                 .size = 1,
                                                 .transferred_at =
                                                     fixture.clock.now});
  auto encoder = ferry::schema::encoding::encoder<
      ferry::schema::encoding::json_encoder_tag>{};
  storage.stage(encoder.encode(snapshot));

  auto reopened = fixture.make_store();
  reopened.load();
  EXPECT_EQ(reopened.size(), 1u);
  EXPECT_TRUE(reopened.find("first").has_value());
  EXPECT_FALSE(reopened.find("second").has_value());
}

TEST(state_store, reloaded_record_matches_nanosecond_listing) {
  auto fixture = state_fixture{};
  auto created = at(2024, 5, 1, 6) + std::chrono::nanoseconds{123456789};
  {
    auto store = fixture.make_store();
    store.load();
    ASSERT_TRUE(
        store.record_transferred("s", "k", 10, created, 1.0, std::nullopt));
  }

  auto reopened = fixture.make_store();
  reopened.load();
  EXPECT_TRUE(reopened.is_up_to_date("k", 10, created));
  EXPECT_FALSE(
      reopened.is_up_to_date("k", 10, created + std::chrono::microseconds{1}));
}
