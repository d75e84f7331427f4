#pragma once

#include <ferry/common/context.hpp>
#include <ferry/provider/provider.hpp>
#include <ferry/schema/object_descriptor.hpp>
#include <ferry/schema/sync_phase.hpp>
#include <ferry/schema/sync_statistics.hpp>
#include <ferry/state/state_store.hpp>
#include <ferry/transfer/executor.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace ferry::execution {

/// A pass could not start: the source listing failed. Nothing was
/// transferred and nothing was persisted.
class sync_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct orchestrator_options final {
  std::string source_prefix{"FOCUS Reports/"};
  /// Matched case-insensitively against the end of each object name.
  std::string accepted_suffix{".csv.gz"};
  std::string destination_prefix;
  /// strftime pattern prepended to the file name; empty disables it.
  std::string date_format;
  std::string separator{"_"};
  uint32_t lookback_days{0};
  std::size_t max_concurrent_transfers{3};
  bool validate_file_size{true};
  ferry::schema::byte_count_t max_file_size_bytes{
      ferry::schema::byte_count_t{5} * 1024 * 1024 * 1024};
  /// Zero keeps records forever.
  std::chrono::days state_retention{30};
  bool dry_run{false};
};

/// Runs sync passes: list, diff against state, transfer what changed with
/// bounded parallelism, then persist and expire old records.
///
/// Passes are serialized; a second caller waits for the running pass.
class orchestrator final {
 public:
  orchestrator(const ferry::common::context& context,
               ferry::provider::source_catalog& source,
               ferry::state::state_store& state,
               ferry::transfer::executor& executor,
               orchestrator_options options,
               ferry::state::clock_fn_t clock = {});

  /// Run one pass. `force` transfers every candidate regardless of state.
  ///
  /// Throws sync_error when listing fails. Per-object failures are counted
  /// in the result and never thrown.
  ferry::schema::sync_statistics_t sync(bool force = false);

  /// Stop dispatching further candidates. Transfers already running finish;
  /// the rest are left for a later pass. Sticky until clear_stop().
  void request_stop();
  void clear_stop();
  bool stop_requested() const;

  ferry::schema::sync_phase_t phase() const;

  /// Destination key for `object`: prefix, optional date segment, basename.
  std::string destination_key(
      const ferry::schema::object_descriptor_t& object) const;

  const orchestrator_options& options() const { return options_; }

 private:
  struct candidate final {
    ferry::schema::object_descriptor_t object;
    std::string key;
  };

  std::vector<ferry::schema::object_descriptor_t> list_candidates();
  void dispatch(std::vector<candidate>& pending,
                ferry::schema::sync_statistics_t& stats);
  void transfer_one(const candidate& item,
                    ferry::schema::sync_statistics_t& stats,
                    std::mutex& stats_mutex);
  void set_phase(ferry::schema::sync_phase_t phase);

  const ferry::common::context& context_;
  ferry::provider::source_catalog& source_;
  ferry::state::state_store& state_;
  ferry::transfer::executor& executor_;
  orchestrator_options options_;
  ferry::state::clock_fn_t clock_;
  std::mutex pass_mutex_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<ferry::schema::sync_phase_t> phase_{
      ferry::schema::sync_phase_t::idle};
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ferry::execution
