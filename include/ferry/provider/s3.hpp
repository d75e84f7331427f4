#pragma once

#include <ferry/provider/provider.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace Aws::S3 {
class S3Client;
}

namespace ferry::provider {

struct s3_options final {
  std::string bucket;
  std::string region{"us-east-1"};
  /// Empty for AWS; set for S3-compatible services (OCI, MinIO).
  std::string endpoint;
  /// Key prefix the connectivity probe is written under.
  std::string prefix;
};

class s3_sdk_session;

/// Objects in one S3 bucket. Names are full object keys.
class s3_catalog final : public source_catalog {
 public:
  explicit s3_catalog(s3_options options);
  ~s3_catalog() override;

  std::vector<ferry::schema::object_descriptor_t> list(
      std::string_view prefix) override;
  std::unique_ptr<read_stream> open_read(std::string_view name) override;
  void test_connectivity() override;
  std::string describe() const override;

 private:
  s3_options options_;
  std::shared_ptr<s3_sdk_session> session_;
  std::shared_ptr<Aws::S3::S3Client> client_;
};

/// Objects below `chunk_size` go up in one PutObject; larger ones use a
/// multipart upload with one part per chunk.
class s3_destination final : public destination_store {
 public:
  s3_destination(s3_options options, std::size_t chunk_size);
  ~s3_destination() override;

  std::unique_ptr<write_stream> open_write(
      std::string_view key,
      ferry::schema::byte_count_t size) override;
  bool exists(std::string_view key) override;
  std::optional<ferry::schema::object_metadata_t> head(
      std::string_view key) override;
  void test_connectivity() override;
  std::string describe() const override;

 private:
  s3_options options_;
  std::size_t chunk_size_;
  std::shared_ptr<s3_sdk_session> session_;
  std::shared_ptr<Aws::S3::S3Client> client_;
};

}  // namespace ferry::provider
