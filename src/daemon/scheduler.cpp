#include <ferry/daemon/scheduler.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

using namespace ferry::schema;

namespace ferry::daemon {

scheduler::scheduler(const ferry::common::context& context,
                     ferry::execution::orchestrator& orchestrator,
                     scheduler_options options,
                     tick_fn_t tick)
    : orchestrator_{orchestrator},
      options_{options},
      tick_{std::move(tick)},
      logger_{context.logger("scheduler")} {
  if (options_.tick <= std::chrono::milliseconds::zero()) {
    options_.tick = std::chrono::milliseconds{1000};
  }
  if (!tick_) {
    tick_ = [](std::chrono::milliseconds duration) {
      std::this_thread::sleep_for(duration);
    };
  }
}

void scheduler::run() {
  logger_->info("scheduler started, polling every {}s",
                options_.poll_interval.count());
  auto force = options_.force_first_pass;
  while (!stop_requested_) {
    static_cast<void>(run_once(force));
    force = false;
    if (stop_requested_) {
      break;
    }
    sleep_until_next_pass();
    if (!stop_requested_) {
      state_ = scheduler_state_t::idle;
    }
  }
  state_ = scheduler_state_t::stopped;
  logger_->info("scheduler stopped after {} passes", passes_.load());
}

std::optional<sync_statistics_t> scheduler::run_once(bool force) {
  state_ = scheduler_state_t::syncing;
  auto out = std::optional<sync_statistics_t>{};
  try {
    out = orchestrator_.sync(force);
  } catch (const std::exception& e) {
    logger_->error("sync pass aborted: {}", e.what());
  }
  ++passes_;
  if (observer_) {
    observer_(out);
  }
  if (!stop_requested_) {
    state_ = scheduler_state_t::idle;
  }
  return out;
}

void scheduler::request_stop() {
  if (!stop_requested_.exchange(true)) {
    logger_->info("stop requested");
  }
  orchestrator_.request_stop();
  state_ = scheduler_state_t::stopped;
}

scheduler_state_t scheduler::state() const {
  return state_;
}

uint64_t scheduler::passes() const {
  return passes_;
}

void scheduler::set_observer(pass_observer_t observer) {
  observer_ = std::move(observer);
}

void scheduler::sleep_until_next_pass() {
  state_ = scheduler_state_t::sleeping;
  logger_->debug("sleeping {}s until next pass",
                 options_.poll_interval.count());
  auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          options_.poll_interval);
  while (remaining > std::chrono::milliseconds::zero() && !stop_requested_) {
    auto step = std::min(remaining, options_.tick);
    tick_(step);
    remaining -= step;
  }
}

}  // namespace ferry::daemon
