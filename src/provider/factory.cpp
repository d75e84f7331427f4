#include <ferry/provider/factory.hpp>
#include <ferry/provider/filesystem.hpp>

#if FERRY_WITH_S3
#include <ferry/provider/s3.hpp>
#endif

#include <stdexcept>
#include <string>

namespace ferry::provider {

namespace {

[[noreturn]] void throw_unsupported(const std::string& role,
                                    const std::string& provider) {
  if (provider == ferry::config::kS3Provider) {
    throw std::invalid_argument{role + " provider 's3' requested but ferry "
                                       "was not built with s3 support"};
  }
  throw std::invalid_argument{"unknown " + role + " provider '" + provider +
                              "'"};
}

}  // namespace

std::unique_ptr<source_catalog> make_source(
    const ferry::config::settings& settings) {
  const auto& source = settings.source;
  if (source.provider == ferry::config::kFilesystemProvider) {
    return std::make_unique<filesystem_catalog>(source.root);
  }
#if FERRY_WITH_S3
  if (source.provider == ferry::config::kS3Provider) {
    return std::make_unique<s3_catalog>(s3_options{.bucket = source.bucket,
                                                   .region = source.region,
                                                   .endpoint = source.endpoint,
                                                   .prefix = source.prefix});
  }
#endif
  throw_unsupported("source", source.provider);
}

std::unique_ptr<destination_store> make_destination(
    const ferry::config::settings& settings) {
  const auto& destination = settings.destination;
  if (destination.provider == ferry::config::kFilesystemProvider) {
    return std::make_unique<filesystem_destination>(destination.root);
  }
#if FERRY_WITH_S3
  if (destination.provider == ferry::config::kS3Provider) {
    auto path = ferry::config::parse_bucket_path(destination.bucket_path);
    if (!path) {
      throw std::invalid_argument{"invalid destination.bucket_path '" +
                                  destination.bucket_path + "'"};
    }
    return std::make_unique<s3_destination>(
        s3_options{.bucket = path->bucket,
                   .region = destination.region,
                   .endpoint = destination.endpoint,
                   .prefix = path->prefix},
        static_cast<std::size_t>(settings.advanced.chunk_size_bytes));
  }
#endif
  throw_unsupported("destination", destination.provider);
}

bool has_s3_support() {
#if FERRY_WITH_S3
  return true;
#else
  return false;
#endif
}

}  // namespace ferry::provider
