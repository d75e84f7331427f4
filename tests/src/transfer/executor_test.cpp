#include <ferry/crypto/checksum.hpp>
#include <ferry/testing/common.hpp>
#include <ferry/testing/memory_provider.hpp>
#include <ferry/transfer/executor.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;
using ferry::testing::at;

struct executor_fixture {
  std::unique_ptr<ferry::common::context> context =
      ferry::testing::make_test_context();
  ferry::testing::memory_catalog source;
  ferry::testing::memory_destination destination;
  std::vector<std::chrono::milliseconds> sleeps;

  ferry::transfer::executor make_executor(
      uint32_t max_retries,
      ferry::transfer::executor_options options = {.chunk_size_bytes = 4}) {
    return ferry::transfer::executor{
        *context,
        source,
        destination,
        ferry::retry::retry_policy{ferry::retry::retry_options{
            .max_retries = max_retries,
            .initial_delay = 100ms,
            .backoff_multiplier = 2.0,
            .max_delay = 250ms}},
        options,
        [this](std::chrono::milliseconds delay) { sleeps.push_back(delay); }};
  }

  ferry::schema::object_descriptor_t put(const std::string& name,
                                         const std::string& content) {
    source.put(name, content, at(2024, 5, 1));
    return ferry::schema::object_descriptor_t{
        .name = name, .size = content.size(), .created_at = at(2024, 5, 1)};
  }
};

std::string md5_of(const std::string& content) {
  return ferry::crypto::md5_hex(
      ferry::schema::make_bytes_view(std::string_view{content}));
}

}  // namespace

TEST(executor, streams_object_to_destination) {
  auto fixture = executor_fixture{};
  auto object = fixture.put("in/report.csv.gz", "0123456789abcdef-tail");
  auto executor = fixture.make_executor(3);

  auto result = executor.transfer(object, "out/report.csv.gz");

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.attempts, 1u);
  EXPECT_EQ(result.bytes_moved, object.size);
  EXPECT_EQ(result.failure, ferry::schema::failure_kind_t::none);
  EXPECT_FALSE(result.error.has_value());
  EXPECT_EQ(result.checksum,
            std::optional<std::string>{md5_of("0123456789abcdef-tail")});
  EXPECT_EQ(fixture.destination.object("out/report.csv.gz"),
            std::optional<std::string>{"0123456789abcdef-tail"});
  EXPECT_TRUE(fixture.sleeps.empty());
}

TEST(executor, retries_transient_failures_with_backoff) {
  auto fixture = executor_fixture{};
  auto object = fixture.put("a.csv.gz", "payload");
  fixture.source.fail_opens("a.csv.gz", 2);
  auto executor = fixture.make_executor(3);

  auto result = executor.transfer(object, "a.csv.gz");

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.attempts, 3u);
  EXPECT_EQ(fixture.sleeps,
            (std::vector<std::chrono::milliseconds>{100ms, 200ms}));
}

TEST(executor, gives_up_after_max_retries_plus_one_attempts) {
  auto fixture = executor_fixture{};
  auto object = fixture.put("a.csv.gz", "payload");
  fixture.source.fail_opens("a.csv.gz", -1);
  auto executor = fixture.make_executor(2);

  auto result = executor.transfer(object, "a.csv.gz");

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.attempts, 3u);
  EXPECT_EQ(fixture.source.open_count("a.csv.gz"), 3u);
  EXPECT_EQ(result.failure, ferry::schema::failure_kind_t::transient);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_NE(result.error->find("open failed"), std::string::npos);
  EXPECT_EQ(fixture.sleeps,
            (std::vector<std::chrono::milliseconds>{100ms, 200ms}));
  EXPECT_FALSE(fixture.destination.object("a.csv.gz").has_value());
}

TEST(executor, backoff_is_capped_by_max_delay) {
  auto fixture = executor_fixture{};
  auto object = fixture.put("a.csv.gz", "payload");
  fixture.source.fail_opens("a.csv.gz", -1);
  auto executor = fixture.make_executor(4);

  static_cast<void>(executor.transfer(object, "a.csv.gz"));

  EXPECT_EQ(fixture.sleeps, (std::vector<std::chrono::milliseconds>{
                                100ms, 200ms, 250ms, 250ms}));
}

TEST(executor, mid_stream_failure_restarts_from_first_byte) {
  auto fixture = executor_fixture{};
  auto object = fixture.put("a.csv.gz", "0123456789");
  fixture.source.fail_reads_after("a.csv.gz", 6, 1);
  auto executor = fixture.make_executor(1);

  auto result = executor.transfer(object, "a.csv.gz");

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.attempts, 2u);
  EXPECT_EQ(fixture.destination.object("a.csv.gz"),
            std::optional<std::string>{"0123456789"});
}

TEST(executor, checksum_mismatch_is_an_integrity_failure_and_retried) {
  auto fixture = executor_fixture{};
  auto object = fixture.put("a.csv.gz", "payload");
  fixture.destination.corrupt_checksums("a.csv.gz", 1);
  auto executor = fixture.make_executor(2);

  auto result = executor.transfer(object, "a.csv.gz");

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.attempts, 2u);
  EXPECT_EQ(fixture.destination.commit_count(), 2u);
}

TEST(executor, persistent_checksum_mismatch_fails_as_integrity) {
  auto fixture = executor_fixture{};
  auto object = fixture.put("a.csv.gz", "payload");
  fixture.destination.corrupt_checksums("a.csv.gz", -1);
  auto executor = fixture.make_executor(1);

  auto result = executor.transfer(object, "a.csv.gz");

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.attempts, 2u);
  EXPECT_EQ(result.failure, ferry::schema::failure_kind_t::integrity);
  EXPECT_NE(result.error->find("checksum mismatch"), std::string::npos);
}

TEST(executor, checksum_validation_can_be_disabled) {
  auto fixture = executor_fixture{};
  auto object = fixture.put("a.csv.gz", "payload");
  fixture.destination.corrupt_checksums("a.csv.gz", -1);
  auto executor = fixture.make_executor(
      0, {.chunk_size_bytes = 4, .validate_checksum = false});

  EXPECT_TRUE(executor.transfer(object, "a.csv.gz").success);
}

TEST(executor, destination_without_checksum_is_accepted) {
  auto fixture = executor_fixture{};
  auto object = fixture.put("a.csv.gz", "payload");
  fixture.destination.omit_checksums(true);
  auto executor = fixture.make_executor(0);

  auto result = executor.transfer(object, "a.csv.gz");
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.checksum, std::optional<std::string>{md5_of("payload")});
}

TEST(executor, size_mismatch_never_reaches_destination) {
  auto fixture = executor_fixture{};
  auto object = fixture.put("a.csv.gz", "payload");
  object.size = 999;
  auto executor = fixture.make_executor(1);

  auto result = executor.transfer(object, "a.csv.gz");

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failure, ferry::schema::failure_kind_t::integrity);
  EXPECT_EQ(fixture.destination.commit_count(), 0u);
  EXPECT_FALSE(fixture.destination.object("a.csv.gz").has_value());
}

TEST(executor, size_mismatch_ignored_when_size_validation_off) {
  auto fixture = executor_fixture{};
  auto object = fixture.put("a.csv.gz", "payload");
  object.size = 999;
  auto executor = fixture.make_executor(
      0, {.chunk_size_bytes = 4, .validate_file_size = false});

  auto result = executor.transfer(object, "a.csv.gz");
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.bytes_moved, 7u);
}

TEST(executor, dry_run_reads_source_without_writing) {
  auto fixture = executor_fixture{};
  auto object = fixture.put("a.csv.gz", "payload");
  auto executor = fixture.make_executor(
      0, {.chunk_size_bytes = 4, .dry_run = true, .dry_run_read_source = true});

  auto result = executor.transfer(object, "a.csv.gz");

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.bytes_moved, 7u);
  EXPECT_EQ(fixture.source.open_count("a.csv.gz"), 1u);
  EXPECT_EQ(fixture.destination.opened_count(), 0u);
}

TEST(executor, dry_run_without_reading_touches_nothing) {
  auto fixture = executor_fixture{};
  auto object = fixture.put("a.csv.gz", "payload");
  auto executor = fixture.make_executor(
      0, {.chunk_size_bytes = 4, .dry_run = true, .dry_run_read_source = false});

  auto result = executor.transfer(object, "a.csv.gz");

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.attempts, 1u);
  EXPECT_EQ(fixture.source.open_count("a.csv.gz"), 0u);
  EXPECT_EQ(fixture.destination.opened_count(), 0u);
}
