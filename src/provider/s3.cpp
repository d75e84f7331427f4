#include <ferry/crypto/checksum.hpp>
#include <ferry/provider/s3.hpp>

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/utils/HashingUtils.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <algorithm>
#include <mutex>
#include <utility>

using namespace ferry::schema;

namespace ferry::provider {

/// Aws::InitAPI / Aws::ShutdownAPI bracket shared by every S3 backend alive
/// in the process.
class s3_sdk_session final {
 public:
  s3_sdk_session() { Aws::InitAPI(options_); }
  ~s3_sdk_session() { Aws::ShutdownAPI(options_); }

  s3_sdk_session(const s3_sdk_session&) = delete;
  s3_sdk_session& operator=(const s3_sdk_session&) = delete;

  static std::shared_ptr<s3_sdk_session> acquire() {
    static auto mutex = std::mutex{};
    static auto current = std::weak_ptr<s3_sdk_session>{};
    auto lock = std::scoped_lock{mutex};
    auto out = current.lock();
    if (!out) {
      out = std::make_shared<s3_sdk_session>();
      current = out;
    }
    return out;
  }

 private:
  Aws::SDKOptions options_;
};

namespace {

constexpr auto kContentType = "application/gzip";
constexpr auto kProbeKey = std::string_view{".ferry-probe"};

std::shared_ptr<Aws::S3::S3Client> make_client(const s3_options& options) {
  auto config = Aws::Client::ClientConfiguration{};
  config.region = options.region;
  if (!options.endpoint.empty()) {
    config.endpointOverride = options.endpoint;
  }
  // Path-style addressing for custom endpoints; most S3-compatible services
  // do not serve virtual-hosted buckets.
  return Aws::MakeShared<Aws::S3::S3Client>(
      "ferry", config,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      options.endpoint.empty());
}

template <typename Error>
transport_error make_error(std::string_view operation,
                           std::string_view target,
                           const Error& error) {
  return transport_error{std::string{operation} + " '" + std::string{target} +
                         "' failed: " + error.GetExceptionName() + ": " +
                         error.GetMessage()};
}

std::string strip_quotes(std::string value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

timestamp_t to_timestamp(const Aws::Utils::DateTime& value) {
  return timestamp_t{std::chrono::duration_cast<timestamp_t::duration>(
      std::chrono::milliseconds{value.Millis()})};
}

std::shared_ptr<Aws::IOStream> make_body(const bytes_t& bytes) {
  auto body = Aws::MakeShared<Aws::StringStream>("ferry");
  body->write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
  return body;
}

Aws::String base64_md5(const bytes_t& digest) {
  return Aws::Utils::HashingUtils::Base64Encode(
      Aws::Utils::ByteBuffer{digest.data(), digest.size()});
}

class s3_read_stream final : public read_stream {
 public:
  s3_read_stream(Aws::S3::Model::GetObjectResult result, std::string key)
      : result_{std::move(result)}, key_{std::move(key)} {}

  std::size_t read(mutable_bytes_view_t buffer) override {
    auto& body = result_.GetBody();
    if (buffer.empty() || body.eof()) {
      return 0;
    }
    body.read(reinterpret_cast<char*>(buffer.data()),
              static_cast<std::streamsize>(buffer.size()));
    if (body.bad()) {
      throw transport_error{"read failed on 's3 object " + key_ + "'"};
    }
    return static_cast<std::size_t>(body.gcount());
  }

 private:
  Aws::S3::Model::GetObjectResult result_;
  std::string key_;
};

/// Buffers one chunk at a time. The first full chunk switches the stream to
/// a multipart upload; a stream that never fills a chunk is sent with one
/// PutObject on commit.
class s3_write_stream final : public write_stream {
 public:
  s3_write_stream(std::shared_ptr<Aws::S3::S3Client> client,
                  std::string bucket,
                  std::string key,
                  std::size_t chunk_size)
      : client_{std::move(client)},
        bucket_{std::move(bucket)},
        key_{std::move(key)},
        chunk_size_{chunk_size} {
    buffer_.reserve(chunk_size_);
  }

  ~s3_write_stream() override {
    if (!finished_) {
      abort();
    }
  }

  void write(const bytes_view_t& bytes) override {
    whole_.update(bytes);
    auto remaining = bytes;
    while (!remaining.empty()) {
      auto take = std::min(remaining.size(), chunk_size_ - buffer_.size());
      buffer_.insert(std::end(buffer_), std::begin(remaining),
                     std::begin(remaining) + static_cast<std::ptrdiff_t>(take));
      remaining = remaining.subspan(take);
      if (buffer_.size() == chunk_size_) {
        upload_part();
      }
    }
  }

  std::optional<std::string> commit() override {
    auto checksum = whole_.finalize_hex();
    if (upload_id_.empty()) {
      put_object(checksum);
    } else {
      if (!buffer_.empty()) {
        upload_part();
      }
      complete_upload();
    }
    finished_ = true;
    return checksum;
  }

  void abort() noexcept override {
    finished_ = true;
    if (upload_id_.empty()) {
      return;
    }
    auto request = Aws::S3::Model::AbortMultipartUploadRequest{};
    request.SetBucket(bucket_);
    request.SetKey(key_);
    request.SetUploadId(upload_id_);
    // Best effort from a noexcept path.
    static_cast<void>(client_->AbortMultipartUpload(request));
    upload_id_.clear();
  }

 private:
  void put_object(const std::string& checksum) {
    auto digest = crypto::md5{};
    digest.update(make_bytes_view(buffer_));
    auto request = Aws::S3::Model::PutObjectRequest{};
    request.SetBucket(bucket_);
    request.SetKey(key_);
    request.SetContentType(kContentType);
    request.SetContentLength(static_cast<long long>(buffer_.size()));
    request.SetContentMD5(base64_md5(digest.finalize()));
    request.SetBody(make_body(buffer_));
    auto outcome = client_->PutObject(request);
    if (!outcome.IsSuccess()) {
      throw make_error("PutObject", key_, outcome.GetError());
    }
    auto etag = strip_quotes(outcome.GetResult().GetETag());
    if (etag != checksum) {
      throw integrity_error{"PutObject '" + key_ + "' returned ETag " + etag +
                            ", expected " + checksum};
    }
  }

  void start_upload() {
    auto request = Aws::S3::Model::CreateMultipartUploadRequest{};
    request.SetBucket(bucket_);
    request.SetKey(key_);
    request.SetContentType(kContentType);
    auto outcome = client_->CreateMultipartUpload(request);
    if (!outcome.IsSuccess()) {
      throw make_error("CreateMultipartUpload", key_, outcome.GetError());
    }
    upload_id_ = outcome.GetResult().GetUploadId();
  }

  void upload_part() {
    if (upload_id_.empty()) {
      start_upload();
    }
    auto part_number = static_cast<int>(part_digests_.size() + 1);
    auto digest = crypto::md5{};
    digest.update(make_bytes_view(buffer_));
    auto raw = digest.finalize();

    auto request = Aws::S3::Model::UploadPartRequest{};
    request.SetBucket(bucket_);
    request.SetKey(key_);
    request.SetUploadId(upload_id_);
    request.SetPartNumber(part_number);
    request.SetContentLength(static_cast<long long>(buffer_.size()));
    request.SetContentMD5(base64_md5(raw));
    request.SetBody(make_body(buffer_));
    auto outcome = client_->UploadPart(request);
    if (!outcome.IsSuccess()) {
      throw make_error("UploadPart", key_, outcome.GetError());
    }

    auto expected = to_hex(make_bytes_view(raw));
    auto etag = strip_quotes(outcome.GetResult().GetETag());
    if (etag != expected) {
      throw integrity_error{"UploadPart " + std::to_string(part_number) +
                            " of '" + key_ + "' returned ETag " + etag +
                            ", expected " + expected};
    }

    auto part = Aws::S3::Model::CompletedPart{};
    part.SetPartNumber(part_number);
    part.SetETag(outcome.GetResult().GetETag());
    completed_.AddParts(std::move(part));
    part_digests_.push_back(std::move(raw));
    buffer_.clear();
  }

  void complete_upload() {
    auto request = Aws::S3::Model::CompleteMultipartUploadRequest{};
    request.SetBucket(bucket_);
    request.SetKey(key_);
    request.SetUploadId(upload_id_);
    request.SetMultipartUpload(completed_);
    auto outcome = client_->CompleteMultipartUpload(request);
    if (!outcome.IsSuccess()) {
      throw make_error("CompleteMultipartUpload", key_, outcome.GetError());
    }
    upload_id_.clear();

    auto expected = crypto::multipart_etag(part_digests_);
    auto etag = strip_quotes(outcome.GetResult().GetETag());
    if (etag != expected) {
      throw integrity_error{"multipart upload of '" + key_ +
                            "' returned ETag " + etag + ", expected " +
                            expected};
    }
  }

  std::shared_ptr<Aws::S3::S3Client> client_;
  std::string bucket_;
  std::string key_;
  std::size_t chunk_size_;
  bytes_t buffer_;
  crypto::md5 whole_;
  std::string upload_id_;
  Aws::S3::Model::CompletedMultipartUpload completed_;
  std::vector<bytes_t> part_digests_;
  bool finished_{false};
};

}  // namespace

s3_catalog::s3_catalog(s3_options options)
    : options_{std::move(options)},
      session_{s3_sdk_session::acquire()},
      client_{make_client(options_)} {}

s3_catalog::~s3_catalog() {
  // The client must go before the SDK session that backs it.
  client_.reset();
}

std::vector<object_descriptor_t> s3_catalog::list(std::string_view prefix) {
  auto out = std::vector<object_descriptor_t>{};
  auto request = Aws::S3::Model::ListObjectsV2Request{};
  request.SetBucket(options_.bucket);
  request.SetPrefix(std::string{prefix});

  while (true) {
    auto outcome = client_->ListObjectsV2(request);
    if (!outcome.IsSuccess()) {
      throw make_error("ListObjectsV2", options_.bucket, outcome.GetError());
    }
    const auto& result = outcome.GetResult();
    for (const auto& object : result.GetContents()) {
      out.push_back(object_descriptor_t{
          .name = object.GetKey(),
          .size = static_cast<byte_count_t>(object.GetSize()),
          .created_at = to_timestamp(object.GetLastModified())});
    }
    if (!result.GetIsTruncated()) {
      break;
    }
    request.SetContinuationToken(result.GetNextContinuationToken());
  }
  return out;
}

std::unique_ptr<read_stream> s3_catalog::open_read(std::string_view name) {
  auto request = Aws::S3::Model::GetObjectRequest{};
  request.SetBucket(options_.bucket);
  request.SetKey(std::string{name});
  auto outcome = client_->GetObject(request);
  if (!outcome.IsSuccess()) {
    throw make_error("GetObject", name, outcome.GetError());
  }
  return std::make_unique<s3_read_stream>(outcome.GetResultWithOwnership(),
                                          std::string{name});
}

void s3_catalog::test_connectivity() {
  auto request = Aws::S3::Model::ListObjectsV2Request{};
  request.SetBucket(options_.bucket);
  request.SetMaxKeys(1);
  auto outcome = client_->ListObjectsV2(request);
  if (!outcome.IsSuccess()) {
    throw make_error("ListObjectsV2", options_.bucket, outcome.GetError());
  }
}

std::string s3_catalog::describe() const {
  return "s3://" + options_.bucket;
}

s3_destination::s3_destination(s3_options options, std::size_t chunk_size)
    : options_{std::move(options)},
      chunk_size_{chunk_size},
      session_{s3_sdk_session::acquire()},
      client_{make_client(options_)} {}

s3_destination::~s3_destination() {
  client_.reset();
}

std::unique_ptr<write_stream> s3_destination::open_write(
    std::string_view key,
    byte_count_t size) {
  static_cast<void>(size);
  return std::make_unique<s3_write_stream>(client_, options_.bucket,
                                           std::string{key}, chunk_size_);
}

bool s3_destination::exists(std::string_view key) {
  return head(key).has_value();
}

std::optional<object_metadata_t> s3_destination::head(std::string_view key) {
  auto request = Aws::S3::Model::HeadObjectRequest{};
  request.SetBucket(options_.bucket);
  request.SetKey(std::string{key});
  auto outcome = client_->HeadObject(request);
  if (!outcome.IsSuccess()) {
    if (outcome.GetError().GetResponseCode() ==
        Aws::Http::HttpResponseCode::NOT_FOUND) {
      return std::nullopt;
    }
    throw make_error("HeadObject", key, outcome.GetError());
  }
  const auto& result = outcome.GetResult();
  return object_metadata_t{
      .size = static_cast<byte_count_t>(result.GetContentLength()),
      .checksum = strip_quotes(result.GetETag()),
      .last_modified = to_timestamp(result.GetLastModified())};
}

void s3_destination::test_connectivity() {
  auto key = options_.prefix;
  if (!key.empty() && !key.ends_with('/')) {
    key += '/';
  }
  key += kProbeKey;
  auto stream = open_write(key, 0);
  stream->write(make_bytes_view(std::string_view{"ferry connectivity probe"}));
  static_cast<void>(stream->commit());

  auto request = Aws::S3::Model::DeleteObjectRequest{};
  request.SetBucket(options_.bucket);
  request.SetKey(key);
  auto outcome = client_->DeleteObject(request);
  if (!outcome.IsSuccess()) {
    throw make_error("DeleteObject", key, outcome.GetError());
  }
}

std::string s3_destination::describe() const {
  return "s3://" + options_.bucket;
}

}  // namespace ferry::provider
