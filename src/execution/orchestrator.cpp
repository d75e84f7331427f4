#include <ferry/execution/orchestrator.hpp>
#include <ferry/execution/worker_pool.hpp>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

using namespace ferry::schema;

namespace ferry::execution {

namespace {

std::string_view basename(std::string_view name) {
  auto slash = name.find_last_of('/');
  if (slash == std::string_view::npos) {
    return name;
  }
  return name.substr(slash + 1);
}

}  // namespace

orchestrator::orchestrator(const ferry::common::context& context,
                           ferry::provider::source_catalog& source,
                           ferry::state::state_store& state,
                           ferry::transfer::executor& executor,
                           orchestrator_options options,
                           ferry::state::clock_fn_t clock)
    : context_{context},
      source_{source},
      state_{state},
      executor_{executor},
      options_{std::move(options)},
      clock_{std::move(clock)},
      logger_{context.logger("sync")} {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
  if (options_.max_concurrent_transfers == 0) {
    options_.max_concurrent_transfers = 1;
  }
}

sync_statistics_t orchestrator::sync(bool force) {
  auto pass = std::scoped_lock{pass_mutex_};
  auto started = std::chrono::steady_clock::now();
  auto stats = sync_statistics_t{};

  logger_->info("sync pass starting{} for {}", force ? " (forced)" : "",
                source_.describe());

  set_phase(sync_phase_t::listing);
  auto objects = std::vector<object_descriptor_t>{};
  try {
    objects = list_candidates();
  } catch (const std::exception& e) {
    set_phase(sync_phase_t::idle);
    logger_->error("listing '{}' failed: {}", options_.source_prefix,
                   e.what());
    throw sync_error{std::string{"listing failed: "} + e.what()};
  }
  stats.files_found = objects.size();
  logger_->info("found {} candidate files", stats.files_found);

  set_phase(sync_phase_t::diffing);
  auto pending = std::vector<candidate>{};
  for (auto& object : objects) {
    auto key = destination_key(object);
    if (!force && object.created_at &&
        state_.is_up_to_date(key, object.size, *object.created_at)) {
      logger_->debug("'{}' already transferred, skipping", object.name);
      ++stats.files_skipped;
      continue;
    }
    if (options_.validate_file_size &&
        object.size > options_.max_file_size_bytes) {
      logger_->error("'{}' is {} which exceeds the {} limit, not transferring",
                     object.name, format_size(object.size),
                     format_size(options_.max_file_size_bytes));
      ++stats.files_failed;
      continue;
    }
    pending.push_back(candidate{.object = std::move(object),
                                .key = std::move(key)});
  }

  set_phase(sync_phase_t::transferring);
  if (!pending.empty()) {
    logger_->info("{} files to transfer, {} skipped", pending.size(),
                  stats.files_skipped);
    dispatch(pending, stats);
  }

  set_phase(sync_phase_t::persisting);
  state_.mark_synced();
  if (!state_.persist()) {
    logger_->warn("state not persisted at end of pass; will retry next pass");
  }

  set_phase(sync_phase_t::cleanup);
  state_.cleanup_expired(options_.state_retention);

  stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  set_phase(sync_phase_t::done);
  logger_->info(
      "sync pass finished in {:.1f}s: found={} transferred={} skipped={} "
      "failed={} bytes={}",
      static_cast<double>(stats.elapsed.count()) / 1000.0, stats.files_found,
      stats.files_transferred, stats.files_skipped, stats.files_failed,
      format_size(stats.bytes_transferred));
  return stats;
}

void orchestrator::request_stop() {
  stop_requested_ = true;
}

void orchestrator::clear_stop() {
  stop_requested_ = false;
}

bool orchestrator::stop_requested() const {
  return stop_requested_;
}

sync_phase_t orchestrator::phase() const {
  return phase_;
}

std::string orchestrator::destination_key(
    const object_descriptor_t& object) const {
  auto file = std::string{};
  if (!options_.date_format.empty() && object.created_at) {
    file = format_utc(*object.created_at, options_.date_format) +
           options_.separator;
  }
  file += basename(object.name);

  auto prefix = boost::algorithm::trim_copy_if(
      options_.destination_prefix, boost::algorithm::is_any_of("/"));
  if (prefix.empty()) {
    return file;
  }
  return prefix + "/" + file;
}

std::vector<object_descriptor_t> orchestrator::list_candidates() {
  auto listed = source_.list(options_.source_prefix);
  auto cutoff = std::optional<timestamp_t>{};
  if (options_.lookback_days > 0) {
    cutoff = clock_() - std::chrono::days{options_.lookback_days};
  }

  auto out = std::vector<object_descriptor_t>{};
  out.reserve(listed.size());
  for (auto& object : listed) {
    if (!boost::algorithm::iends_with(object.name, options_.accepted_suffix)) {
      continue;
    }
    if (cutoff && object.created_at && *object.created_at < *cutoff) {
      continue;
    }
    out.push_back(std::move(object));
  }
  return out;
}

void orchestrator::dispatch(std::vector<candidate>& pending,
                            sync_statistics_t& stats) {
  auto stats_mutex = std::mutex{};
  auto abandoned = std::size_t{0};
  {
    auto pool = worker_pool{context_, options_.max_concurrent_transfers};
    for (auto i = std::size_t{0}; i < pending.size(); ++i) {
      if (stop_requested_) {
        abandoned = pending.size() - i;
        break;
      }
      pool.submit([this, &item = pending[i], &stats, &stats_mutex] {
        // The counters are bumped last, so a throw means nothing was counted.
        try {
          transfer_one(item, stats, stats_mutex);
        } catch (const std::exception& e) {
          logger_->error("transfer of '{}' aborted: {}", item.object.name,
                         e.what());
          auto lock = std::scoped_lock{stats_mutex};
          ++stats.files_failed;
        } catch (...) {
          logger_->error("transfer of '{}' aborted by a non-standard exception",
                         item.object.name);
          auto lock = std::scoped_lock{stats_mutex};
          ++stats.files_failed;
        }
      });
    }
    pool.wait_idle();
  }

  if (abandoned > 0) {
    logger_->warn("stop requested; {} files left for the next pass",
                  abandoned);
  }
}

void orchestrator::transfer_one(const candidate& item,
                                sync_statistics_t& stats,
                                std::mutex& stats_mutex) {
  auto result = executor_.transfer(item.object, item.key);
  if (!result.success) {
    logger_->error("failed to transfer '{}' after {} attempts: {}",
                   item.object.name, result.attempts,
                   result.error.value_or("unknown error"));
    auto lock = std::scoped_lock{stats_mutex};
    ++stats.files_failed;
    return;
  }
  if (!options_.dry_run) {
    auto persisted = state_.record_transferred(
        item.object.name, item.key, item.object.size, item.object.created_at,
        result.duration.count(), result.checksum);
    if (!persisted) {
      logger_->warn("'{}' transferred but its record is not yet on disk",
                    item.key);
    }
  }
  auto lock = std::scoped_lock{stats_mutex};
  ++stats.files_transferred;
  stats.bytes_transferred += result.bytes_moved;
}

void orchestrator::set_phase(sync_phase_t phase) {
  phase_ = phase;
  logger_->debug("phase: {}", to_string(phase));
}

}  // namespace ferry::execution
