#include <ferry/config/settings.hpp>

#include <boost/program_options.hpp>

#include <cmath>
#include <cstdlib>
#include <fstream>

namespace ferry::config {

namespace {

constexpr auto kMinimumPollInterval = int64_t{60};
constexpr auto kMinimumChunkSize = int64_t{1024};
constexpr auto kMinimumS3PartSize = int64_t{5 * 1024 * 1024};
constexpr auto kBytesPerGigabyte = 1024.0 * 1024.0 * 1024.0;

boost::program_options::options_description describe(settings& s) {
  namespace po = boost::program_options;
  auto description = po::options_description{"ferry configuration"};
  description.add_options()
      // [source]
      ("source.provider", po::value(&s.source.provider)->default_value(s.source.provider))
      ("source.root", po::value(&s.source.root))
      ("source.bucket", po::value(&s.source.bucket))
      ("source.endpoint", po::value(&s.source.endpoint))
      ("source.region", po::value(&s.source.region)->default_value(s.source.region))
      ("source.prefix", po::value(&s.source.prefix)->default_value(s.source.prefix))
      ("source.suffix", po::value(&s.source.suffix)->default_value(s.source.suffix))
      // [destination]
      ("destination.provider", po::value(&s.destination.provider)->default_value(s.destination.provider))
      ("destination.root", po::value(&s.destination.root))
      ("destination.bucket_path", po::value(&s.destination.bucket_path))
      ("destination.prefix", po::value(&s.destination.prefix))
      ("destination.endpoint", po::value(&s.destination.endpoint))
      ("destination.region", po::value(&s.destination.region)->default_value(s.destination.region))
      // [agent]
      ("agent.poll_interval", po::value(&s.agent.poll_interval)->default_value(s.agent.poll_interval))
      ("agent.lookback_days", po::value(&s.agent.lookback_days)->default_value(s.agent.lookback_days))
      ("agent.max_concurrent_transfers", po::value(&s.agent.max_concurrent_transfers)->default_value(s.agent.max_concurrent_transfers))
      // [retry]
      ("retry.max_retries", po::value(&s.retry.max_retries)->default_value(s.retry.max_retries))
      ("retry.initial_delay", po::value(&s.retry.initial_delay)->default_value(s.retry.initial_delay))
      ("retry.backoff_multiplier", po::value(&s.retry.backoff_multiplier)->default_value(s.retry.backoff_multiplier))
      ("retry.max_delay", po::value(&s.retry.max_delay)->default_value(s.retry.max_delay))
      // [logging]
      ("logging.level", po::value(&s.logging.level)->default_value(s.logging.level))
      ("logging.file", po::value(&s.logging.file))
      ("logging.max_size_mb", po::value(&s.logging.max_size_mb)->default_value(s.logging.max_size_mb))
      ("logging.backup_count", po::value(&s.logging.backup_count)->default_value(s.logging.backup_count))
      ("logging.pattern", po::value(&s.logging.pattern)->default_value(s.logging.pattern))
      // [state]
      ("state.file", po::value(&s.state.file)->default_value(s.state.file))
      ("state.retention_days", po::value(&s.state.retention_days)->default_value(s.state.retention_days))
      // [naming]
      ("naming.date_format", po::value(&s.naming.date_format))
      ("naming.separator", po::value(&s.naming.separator)->default_value(s.naming.separator))
      // [advanced]
      ("advanced.validate_file_size", po::value(&s.advanced.validate_file_size)->default_value(s.advanced.validate_file_size))
      ("advanced.max_file_size_gb", po::value(&s.advanced.max_file_size_gb)->default_value(s.advanced.max_file_size_gb))
      ("advanced.chunk_size_bytes", po::value(&s.advanced.chunk_size_bytes)->default_value(s.advanced.chunk_size_bytes))
      ("advanced.validate_checksum", po::value(&s.advanced.validate_checksum)->default_value(s.advanced.validate_checksum))
      ("advanced.dry_run", po::value(&s.advanced.dry_run)->default_value(s.advanced.dry_run))
      ("advanced.dry_run_read_source", po::value(&s.advanced.dry_run_read_source)->default_value(s.advanced.dry_run_read_source))
      // [health]
      ("health.listen_address", po::value(&s.health.listen_address));
  return description;
}

std::string expand_user(const std::string& path) {
  if (!path.starts_with("~/")) {
    return path;
  }
  const auto* home = std::getenv("HOME");
  if (home == nullptr) {
    return path;
  }
  return std::string{home} + path.substr(1);
}

bool is_provider(const std::string& value) {
  return value == kFilesystemProvider || value == kS3Provider;
}

}  // namespace

std::optional<bucket_path> parse_bucket_path(std::string_view value) {
  constexpr auto kScheme = std::string_view{"s3://"};
  if (!value.starts_with(kScheme)) {
    return std::nullopt;
  }
  value.remove_prefix(kScheme.size());
  auto slash = value.find('/');
  auto out = bucket_path{};
  out.bucket = std::string{value.substr(0, slash)};
  if (slash != std::string_view::npos) {
    out.prefix = std::string{value.substr(slash + 1)};
  }
  if (out.bucket.empty()) {
    return std::nullopt;
  }
  return out;
}

settings load_settings(const std::filesystem::path& path) {
  auto in = std::ifstream{path};
  if (!in) {
    throw config_error{"configuration file not found or unreadable: " +
                       path.string()};
  }
  return parse_settings(in);
}

settings parse_settings(std::istream& in) {
  auto out = settings{};
  auto description = describe(out);
  try {
    auto vm = boost::program_options::variables_map{};
    boost::program_options::store(
        boost::program_options::parse_config_file(in, description, false), vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    throw config_error{std::string{"invalid configuration: "} + e.what()};
  }

  out.source.root = expand_user(out.source.root);
  out.destination.root = expand_user(out.destination.root);
  out.state.file = expand_user(out.state.file);
  out.logging.file = expand_user(out.logging.file);
  return out;
}

std::vector<std::string> validate(const settings& value) {
  auto errors = std::vector<std::string>{};

  if (!is_provider(value.source.provider)) {
    errors.push_back("source.provider must be 'filesystem' or 's3'");
  } else if (value.source.provider == kFilesystemProvider &&
             value.source.root.empty()) {
    errors.push_back("source.root is required for the filesystem provider");
  } else if (value.source.provider == kS3Provider &&
             value.source.bucket.empty()) {
    errors.push_back("source.bucket is required for the s3 provider");
  }
  if (value.source.suffix.empty()) {
    errors.push_back("source.suffix must not be empty");
  }

  if (!is_provider(value.destination.provider)) {
    errors.push_back("destination.provider must be 'filesystem' or 's3'");
  } else if (value.destination.provider == kFilesystemProvider &&
             value.destination.root.empty()) {
    errors.push_back(
        "destination.root is required for the filesystem provider");
  } else if (value.destination.provider == kS3Provider &&
             !parse_bucket_path(value.destination.bucket_path)) {
    errors.push_back(
        "destination.bucket_path must look like 's3://bucket[/prefix]'");
  }

  if (value.agent.poll_interval < kMinimumPollInterval) {
    errors.push_back("agent.poll_interval must be at least 60 seconds");
  }
  if (value.agent.lookback_days < 0) {
    errors.push_back("agent.lookback_days must be >= 0");
  }
  if (value.agent.max_concurrent_transfers < 1) {
    errors.push_back("agent.max_concurrent_transfers must be at least 1");
  }

  if (value.retry.max_retries < 0) {
    errors.push_back("retry.max_retries must be >= 0");
  }
  if (value.retry.initial_delay < 0.0) {
    errors.push_back("retry.initial_delay must be >= 0");
  }
  if (value.retry.backoff_multiplier < 1.0) {
    errors.push_back("retry.backoff_multiplier must be >= 1");
  }
  if (value.retry.max_delay < value.retry.initial_delay) {
    errors.push_back("retry.max_delay must be >= retry.initial_delay");
  }

  if (!ferry::common::is_valid_log_level(value.logging.level)) {
    errors.push_back("logging.level '" + value.logging.level +
                     "' is not a known level");
  }

  if (value.state.file.empty()) {
    errors.push_back("state.file must not be empty");
  }
  if (value.state.retention_days < 0) {
    errors.push_back("state.retention_days must be >= 0");
  }

  if (value.advanced.max_file_size_gb < 1.0) {
    errors.push_back("advanced.max_file_size_gb must be at least 1");
  }
  if (value.advanced.chunk_size_bytes < kMinimumChunkSize) {
    errors.push_back("advanced.chunk_size_bytes must be at least 1024 bytes");
  } else if (value.destination.provider == kS3Provider &&
             value.advanced.chunk_size_bytes < kMinimumS3PartSize) {
    errors.push_back(
        "advanced.chunk_size_bytes must be at least 5 MiB for an s3 "
        "destination");
  }

  return errors;
}

std::string destination_prefix(const settings& value) {
  if (value.destination.provider == kS3Provider) {
    if (auto parsed = parse_bucket_path(value.destination.bucket_path)) {
      return parsed->prefix;
    }
    return {};
  }
  return value.destination.prefix;
}

ferry::retry::retry_options make_retry_options(const settings& value) {
  auto to_millis = [](double seconds) {
    return std::chrono::milliseconds{
        static_cast<int64_t>(std::llround(seconds * 1000.0))};
  };
  return ferry::retry::retry_options{
      .max_retries = static_cast<uint32_t>(value.retry.max_retries),
      .initial_delay = to_millis(value.retry.initial_delay),
      .backoff_multiplier = value.retry.backoff_multiplier,
      .max_delay = to_millis(value.retry.max_delay)};
}

ferry::transfer::executor_options make_executor_options(const settings& value) {
  return ferry::transfer::executor_options{
      .chunk_size_bytes =
          static_cast<std::size_t>(value.advanced.chunk_size_bytes),
      .validate_checksum = value.advanced.validate_checksum,
      .validate_file_size = value.advanced.validate_file_size,
      .dry_run = value.advanced.dry_run,
      .dry_run_read_source = value.advanced.dry_run_read_source};
}

ferry::execution::orchestrator_options make_orchestrator_options(
    const settings& value) {
  return ferry::execution::orchestrator_options{
      .source_prefix = value.source.prefix,
      .accepted_suffix = value.source.suffix,
      .destination_prefix = destination_prefix(value),
      .date_format = value.naming.date_format,
      .separator = value.naming.separator,
      .lookback_days = static_cast<uint32_t>(value.agent.lookback_days),
      .max_concurrent_transfers =
          static_cast<std::size_t>(value.agent.max_concurrent_transfers),
      .validate_file_size = value.advanced.validate_file_size,
      .max_file_size_bytes = static_cast<ferry::schema::byte_count_t>(
          value.advanced.max_file_size_gb * kBytesPerGigabyte),
      .state_retention = std::chrono::days{value.state.retention_days},
      .dry_run = value.advanced.dry_run};
}

ferry::daemon::scheduler_options make_scheduler_options(const settings& value) {
  return ferry::daemon::scheduler_options{
      .poll_interval = std::chrono::seconds{value.agent.poll_interval}};
}

}  // namespace ferry::config
