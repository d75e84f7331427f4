#pragma once

#include <ferry/common/context.hpp>
#include <ferry/provider/provider.hpp>
#include <ferry/retry/retry_policy.hpp>
#include <ferry/schema/object_descriptor.hpp>
#include <ferry/schema/transfer_result.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string_view>

namespace ferry::transfer {

struct executor_options final {
  std::size_t chunk_size_bytes{8 * 1024 * 1024};
  bool validate_checksum{true};
  bool validate_file_size{true};
  bool dry_run{false};
  /// In dry run, still stream the source (and discard it) to prove it reads.
  bool dry_run_read_source{true};
};

using sleep_fn_t = std::function<void(std::chrono::milliseconds)>;

/// Moves one object from source to destination under a retry policy.
///
/// The payload is streamed in `chunk_size_bytes` pieces and never held in
/// memory as a whole. Every attempt starts over from the first byte. The
/// executor never touches persisted state; recording the outcome is the
/// caller's job.
class executor final {
 public:
  /// `sleep` waits out the backoff between attempts; defaults to
  /// std::this_thread::sleep_for.
  executor(const ferry::common::context& context,
           ferry::provider::source_catalog& source,
           ferry::provider::destination_store& destination,
           ferry::retry::retry_policy policy,
           executor_options options,
           sleep_fn_t sleep = {});

  ferry::schema::transfer_result_t transfer(
      const ferry::schema::object_descriptor_t& object,
      std::string_view destination_key);

  const executor_options& options() const { return options_; }

 private:
  struct attempt_outcome final {
    ferry::schema::byte_count_t bytes{};
    std::string checksum;
  };

  /// One full pass over the source. Throws on any failure.
  attempt_outcome attempt(const ferry::schema::object_descriptor_t& object,
                          std::string_view destination_key);

  ferry::provider::source_catalog& source_;
  ferry::provider::destination_store& destination_;
  ferry::retry::retry_policy policy_;
  executor_options options_;
  sleep_fn_t sleep_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ferry::transfer
