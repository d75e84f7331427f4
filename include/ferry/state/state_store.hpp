#pragma once

#include <ferry/common/context.hpp>
#include <ferry/schema/encoding/json/encoder.hpp>
#include <ferry/schema/primitives.hpp>
#include <ferry/schema/state_snapshot.hpp>
#include <ferry/schema/state_summary.hpp>
#include <ferry/schema/transfer_record.hpp>
#include <ferry/storage/file/storage.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::state {

using clock_fn_t = std::function<ferry::schema::timestamp_t()>;

/// Durable map from destination key to the record of its last transfer.
///
/// The whole snapshot lives in memory and is written through to disk as one
/// document on every mutation that matters. All members are safe to call
/// from transfer workers concurrently; one writer lock covers the in-memory
/// update and the atomic file replace.
class state_store final {
 public:
  /// `clock` defaults to std::chrono::system_clock::now.
  state_store(const ferry::common::context& context,
              std::filesystem::path path,
              clock_fn_t clock = {});

  /// Read the snapshot from disk, replacing anything held in memory.
  ///
  /// A missing file starts empty (info log); an unreadable or corrupt file
  /// starts empty too (warning log). Never throws.
  void load();

  /// True only if a record for `key` exists with the same size and a stored
  /// created_at that is not earlier than `created_at`.
  bool is_up_to_date(std::string_view key,
                     ferry::schema::byte_count_t size,
                     const ferry::schema::timestamp_t& created_at) const;

  /// Insert or overwrite the record for `destination_key`, stamp it with the
  /// current time and persist the full snapshot.
  ///
  /// Returns the persist outcome; the in-memory record is kept either way.
  bool record_transferred(
      std::string_view source_name,
      std::string_view destination_key,
      ferry::schema::byte_count_t size,
      const std::optional<ferry::schema::timestamp_t>& created_at,
      double duration_seconds,
      const std::optional<std::string>& checksum);

  /// Set last_sync_at to now. Does not persist.
  void mark_synced();

  /// Atomically replace the on-disk snapshot. Failures are logged and
  /// reported as false.
  bool persist();

  /// Drop records transferred before `now - retention`. A zero retention
  /// keeps everything. Persists only when something was removed.
  std::size_t cleanup_expired(std::chrono::days retention);

  ferry::schema::state_summary_t stats() const;

  std::optional<ferry::schema::transfer_record_t> find(
      std::string_view key) const;

  std::size_t size() const;

  const std::filesystem::path& path() const;

 private:
  bool persist_locked();
  ferry::schema::timestamp_t now() const;

  mutable std::mutex mutex_;
  std::filesystem::path path_;
  clock_fn_t clock_;
  ferry::storage::storage<ferry::storage::file_storage_tag> storage_;
  ferry::schema::encoding::encoder<ferry::schema::encoding::json_encoder_tag>
      encoder_;
  ferry::schema::state_snapshot_t snapshot_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ferry::state
