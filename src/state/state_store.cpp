#include <ferry/state/state_store.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <iterator>
#include <utility>

using namespace ferry::schema;

namespace ferry::state {

state_store::state_store(const ferry::common::context& context,
                         std::filesystem::path path,
                         clock_fn_t clock)
    : path_{std::move(path)},
      clock_{std::move(clock)},
      storage_{ferry::storage::make_storage<ferry::storage::file_storage_tag>(
          path_)},
      logger_{context.logger("state")} {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

void state_store::load() {
  auto lock = std::scoped_lock{mutex_};
  snapshot_ = state_snapshot_t{};

  auto document = std::optional<std::string>{};
  try {
    document = storage_.load();
  } catch (const std::exception& e) {
    logger_->warn("state file '{}' unreadable, starting empty: {}",
                  path_.string(), e.what());
    return;
  }

  if (!document) {
    logger_->info("no state file at '{}', starting empty", path_.string());
    return;
  }

  try {
    snapshot_ = encoder_.decode<state_snapshot_t>(*document);
  } catch (const std::exception& e) {
    snapshot_ = state_snapshot_t{};
    logger_->warn("state file '{}' is corrupt, starting empty: {}",
                  path_.string(), e.what());
    return;
  }

  logger_->info("loaded state for {} files from '{}'", snapshot_.records.size(),
                path_.string());
}

bool state_store::is_up_to_date(std::string_view key,
                                byte_count_t size,
                                const timestamp_t& created_at) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = snapshot_.records.find(std::string{key});
  if (it == std::end(snapshot_.records)) {
    return false;
  }
  const auto& record = it->second;
  if (record.size != size) {
    return false;
  }
  // A record without created_at cannot prove freshness.
  if (!record.created_at) {
    return false;
  }
  return to_stored_precision(*record.created_at) >=
         to_stored_precision(created_at);
}

bool state_store::record_transferred(
    std::string_view source_name,
    std::string_view destination_key,
    byte_count_t size,
    const std::optional<timestamp_t>& created_at,
    double duration_seconds,
    const std::optional<std::string>& checksum) {
  auto stored_created_at = std::optional<timestamp_t>{};
  if (created_at) {
    stored_created_at = to_stored_precision(*created_at);
  }

  auto transferred_at = to_stored_precision(now());
  auto lock = std::scoped_lock{mutex_};
  auto record = transfer_record_t{.source_name = std::string{source_name},
                                  .destination_key =
                                      std::string{destination_key},
                                  .size = size,
                                  .created_at = stored_created_at,
                                  .transferred_at = transferred_at,
                                  .checksum = checksum,
                                  .duration_seconds = duration_seconds};
  snapshot_.records.insert_or_assign(std::string{destination_key},
                                     std::move(record));
  logger_->debug("recorded transfer of '{}' as '{}'", source_name,
                 destination_key);
  return persist_locked();
}

void state_store::mark_synced() {
  auto lock = std::scoped_lock{mutex_};
  snapshot_.last_sync_at = now();
}

bool state_store::persist() {
  auto lock = std::scoped_lock{mutex_};
  return persist_locked();
}

std::size_t state_store::cleanup_expired(std::chrono::days retention) {
  if (retention.count() <= 0) {
    return 0;
  }

  auto lock = std::scoped_lock{mutex_};
  auto cutoff = now() - retention;
  auto removed = std::erase_if(snapshot_.records, [&](const auto& entry) {
    return entry.second.transferred_at < cutoff;
  });
  if (removed > 0) {
    logger_->info("expired {} records older than {} days", removed,
                  retention.count());
    static_cast<void>(persist_locked());
  }
  return removed;
}

state_summary_t state_store::stats() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = state_summary_t{.total_files = snapshot_.records.size(),
                             .total_bytes = 0,
                             .last_sync_at = snapshot_.last_sync_at};
  for (const auto& [key, record] : snapshot_.records) {
    out.total_bytes += record.size;
  }
  return out;
}

std::optional<transfer_record_t> state_store::find(std::string_view key) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = snapshot_.records.find(std::string{key});
  if (it == std::end(snapshot_.records)) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t state_store::size() const {
  auto lock = std::scoped_lock{mutex_};
  return snapshot_.records.size();
}

const std::filesystem::path& state_store::path() const {
  return path_;
}

bool state_store::persist_locked() {
  try {
    storage_.replace(encoder_.encode(snapshot_));
    return true;
  } catch (const std::exception& e) {
    logger_->error("failed to persist state to '{}': {}", path_.string(),
                   e.what());
    return false;
  }
}

timestamp_t state_store::now() const {
  return clock_();
}

}  // namespace ferry::state
