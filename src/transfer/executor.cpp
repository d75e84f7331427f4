#include <ferry/crypto/checksum.hpp>
#include <ferry/transfer/executor.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <thread>
#include <utility>

using namespace ferry::schema;

namespace ferry::transfer {

executor::executor(const ferry::common::context& context,
                   ferry::provider::source_catalog& source,
                   ferry::provider::destination_store& destination,
                   ferry::retry::retry_policy policy,
                   executor_options options,
                   sleep_fn_t sleep)
    : source_{source},
      destination_{destination},
      policy_{std::move(policy)},
      options_{std::move(options)},
      sleep_{std::move(sleep)},
      logger_{context.logger("transfer")} {
  if (options_.chunk_size_bytes == 0) {
    options_.chunk_size_bytes = executor_options{}.chunk_size_bytes;
  }
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds delay) {
      std::this_thread::sleep_for(delay);
    };
  }
}

transfer_result_t executor::transfer(const object_descriptor_t& object,
                                     std::string_view destination_key) {
  auto started = std::chrono::steady_clock::now();
  auto result = transfer_result_t{};

  if (options_.dry_run && !options_.dry_run_read_source) {
    logger_->info("dry run: would transfer '{}' -> '{}' ({})", object.name,
                  destination_key, format_size(object.size));
    result.success = true;
    result.bytes_moved = object.size;
    result.attempts = 1;
    result.duration = std::chrono::steady_clock::now() - started;
    return result;
  }

  logger_->info("transferring '{}' -> '{}' ({})", object.name, destination_key,
                format_size(object.size));

  auto tries = policy_.max_attempts();
  for (auto n = uint32_t{1}; n <= tries; ++n) {
    result.attempts = n;
    try {
      auto outcome = attempt(object, destination_key);
      result.success = true;
      result.failure = failure_kind_t::none;
      result.error.reset();
      result.bytes_moved = outcome.bytes;
      result.checksum = std::move(outcome.checksum);
      break;
    } catch (const ferry::provider::integrity_error& e) {
      result.failure = failure_kind_t::integrity;
      result.error = e.what();
    } catch (const std::exception& e) {
      result.failure = failure_kind_t::transient;
      result.error = e.what();
    }

    // Retry n follows try n; the final try has nothing after it.
    if (!policy_.should_retry(n)) {
      break;
    }
    auto delay = policy_.next_delay(n);
    logger_->warn("attempt {}/{} for '{}' failed ({}): {}; retrying in {} ms",
                  n, tries, object.name, to_string(result.failure),
                  *result.error, delay.count());
    sleep_(delay);
  }

  result.duration = std::chrono::steady_clock::now() - started;
  if (result.success) {
    logger_->info("{} '{}' ({}) in {:.2f}s",
                  options_.dry_run ? "dry run: read" : "transferred",
                  object.name, format_size(result.bytes_moved),
                  result.duration.count());
  }
  return result;
}

executor::attempt_outcome executor::attempt(const object_descriptor_t& object,
                                            std::string_view destination_key) {
  auto reader = source_.open_read(object.name);
  auto writer = std::unique_ptr<ferry::provider::write_stream>{};
  if (!options_.dry_run) {
    writer = destination_.open_write(destination_key, object.size);
  }

  auto hasher = ferry::crypto::md5{};
  auto buffer = bytes_t(options_.chunk_size_bytes);
  auto out = attempt_outcome{};
  while (true) {
    auto count = reader->read(mutable_bytes_view_t{buffer});
    if (count == 0) {
      break;
    }
    auto chunk = bytes_view_t{buffer.data(), count};
    hasher.update(chunk);
    if (writer) {
      writer->write(chunk);
    }
    out.bytes += count;
  }
  out.checksum = hasher.finalize_hex();

  // Size is checked before commit so a short read never becomes visible.
  if (options_.validate_file_size && out.bytes != object.size) {
    if (writer) {
      writer->abort();
    }
    throw ferry::provider::integrity_error{
        "size mismatch for '" + object.name + "': listed " +
        std::to_string(object.size) + " bytes, read " +
        std::to_string(out.bytes)};
  }

  if (!writer) {
    return out;
  }

  auto reported = writer->commit();
  if (options_.validate_checksum) {
    if (!reported) {
      logger_->debug("destination reported no checksum for '{}'",
                     destination_key);
    } else if (*reported != out.checksum) {
      throw ferry::provider::integrity_error{
          "checksum mismatch for '" + std::string{destination_key} +
          "': sent " + out.checksum + ", destination has " + *reported};
    }
  }
  return out;
}

}  // namespace ferry::transfer
