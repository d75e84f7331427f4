#pragma once

#include <ferry/common/context.hpp>
#include <ferry/execution/orchestrator.hpp>
#include <ferry/schema/scheduler_state.hpp>
#include <ferry/schema/sync_statistics.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace ferry::daemon {

struct scheduler_options final {
  std::chrono::seconds poll_interval{600};
  /// Granularity at which a sleeping scheduler notices a stop request.
  std::chrono::milliseconds tick{1000};
  /// Force only the first pass.
  bool force_first_pass{false};
};

/// Called after every pass. std::nullopt means the pass aborted.
using pass_observer_t =
    std::function<void(const std::optional<ferry::schema::sync_statistics_t>&)>;

using tick_fn_t = std::function<void(std::chrono::milliseconds)>;

/// Runs orchestrator passes back to back with a fixed sleep between them.
///
/// idle -> syncing -> sleeping -> idle, until a stop request moves it to
/// stopped. The stop flag is checked after each pass and on every tick of
/// the sleep.
class scheduler final {
 public:
  /// `tick` sleeps for one tick; defaults to std::this_thread::sleep_for.
  scheduler(const ferry::common::context& context,
            ferry::execution::orchestrator& orchestrator,
            scheduler_options options,
            tick_fn_t tick = {});

  /// Loop until request_stop(). Pass failures are logged and never end the
  /// loop.
  void run();

  /// One pass outside the loop. Returns std::nullopt if it aborted.
  std::optional<ferry::schema::sync_statistics_t> run_once(bool force = false);

  /// Safe from any thread, including a signal-watching one. Also stops the
  /// orchestrator from dispatching more work in the current pass.
  void request_stop();

  ferry::schema::scheduler_state_t state() const;

  uint64_t passes() const;

  void set_observer(pass_observer_t observer);

 private:
  void sleep_until_next_pass();

  ferry::execution::orchestrator& orchestrator_;
  scheduler_options options_;
  tick_fn_t tick_;
  pass_observer_t observer_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<ferry::schema::scheduler_state_t> state_{
      ferry::schema::scheduler_state_t::idle};
  std::atomic<uint64_t> passes_{0};
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ferry::daemon
