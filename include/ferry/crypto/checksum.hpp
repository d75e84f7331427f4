#pragma once

#include <ferry/schema/primitives.hpp>

#include <openssl/evp.h>

#include <memory>
#include <string>
#include <vector>

namespace ferry::crypto {

/// Incremental MD5 over OpenSSL EVP.
///
/// Throws std::runtime_error if the digest context cannot be set up. After
/// finalize() the object must not be updated again.
class md5 final {
 public:
  md5();

  void update(const ferry::schema::bytes_view_t& bytes);

  /// Raw 16-byte digest.
  ferry::schema::bytes_t finalize();

  /// Lowercase hex digest.
  std::string finalize_hex();

 private:
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context_;
};

std::string md5_hex(const ferry::schema::bytes_view_t& bytes);

/// S3 multipart ETag: MD5 over the concatenated raw part digests, followed
/// by `-<part count>`.
std::string multipart_etag(const std::vector<ferry::schema::bytes_t>& parts);

}  // namespace ferry::crypto
