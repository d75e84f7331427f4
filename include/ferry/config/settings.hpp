#pragma once

#include <ferry/common/context.hpp>
#include <ferry/daemon/scheduler.hpp>
#include <ferry/execution/orchestrator.hpp>
#include <ferry/retry/retry_policy.hpp>
#include <ferry/transfer/executor.hpp>

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::config {

/// The file could not be read or parsed at all (as opposed to holding
/// values that fail validate()).
class config_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

inline constexpr auto kFilesystemProvider = std::string_view{"filesystem"};
inline constexpr auto kS3Provider = std::string_view{"s3"};

struct source_settings final {
  std::string provider{kFilesystemProvider};
  std::string root;
  std::string bucket;
  std::string endpoint;
  std::string region{"us-east-1"};
  std::string prefix{"FOCUS Reports/"};
  std::string suffix{".csv.gz"};
};

struct destination_settings final {
  std::string provider{kFilesystemProvider};
  std::string root;
  /// `s3://bucket[/prefix]`.
  std::string bucket_path;
  std::string prefix;
  std::string endpoint;
  std::string region{"us-east-1"};
};

// Signed so that negative input reaches validate() instead of wrapping.
struct agent_settings final {
  int64_t poll_interval{600};
  int64_t lookback_days{0};
  int64_t max_concurrent_transfers{3};
};

struct retry_settings final {
  int64_t max_retries{3};
  double initial_delay{5.0};
  double backoff_multiplier{2.0};
  double max_delay{300.0};
};

struct state_settings final {
  std::string file{"./state/state.json"};
  int64_t retention_days{30};
};

struct naming_settings final {
  std::string date_format;
  std::string separator{"_"};
};

struct advanced_settings final {
  bool validate_file_size{true};
  double max_file_size_gb{5.0};
  int64_t chunk_size_bytes{8 * 1024 * 1024};
  bool validate_checksum{true};
  bool dry_run{false};
  bool dry_run_read_source{true};
};

struct health_settings final {
  /// Empty disables the health endpoint.
  std::string listen_address;
};

struct settings final {
  source_settings source;
  destination_settings destination;
  agent_settings agent;
  retry_settings retry;
  ferry::common::log_settings logging;
  state_settings state;
  naming_settings naming;
  advanced_settings advanced;
  health_settings health;
};

struct bucket_path final {
  std::string bucket;
  std::string prefix;
};

/// Split `s3://bucket/some/prefix`. std::nullopt unless the scheme is s3://
/// and a bucket name is present.
std::optional<bucket_path> parse_bucket_path(std::string_view value);

/// Read an INI file. Throws config_error if it is missing, unreadable, or
/// holds unknown keys or unparsable values.
settings load_settings(const std::filesystem::path& path);
settings parse_settings(std::istream& in);

/// Every problem found, as human-readable messages. Empty means usable.
std::vector<std::string> validate(const settings& value);

/// Destination key prefix: from bucket_path for s3, `prefix` otherwise.
std::string destination_prefix(const settings& value);

ferry::retry::retry_options make_retry_options(const settings& value);
ferry::transfer::executor_options make_executor_options(const settings& value);
ferry::execution::orchestrator_options make_orchestrator_options(
    const settings& value);
ferry::daemon::scheduler_options make_scheduler_options(const settings& value);

}  // namespace ferry::config
