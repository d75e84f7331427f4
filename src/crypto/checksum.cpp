#include <ferry/crypto/checksum.hpp>

#include <stdexcept>

namespace ferry::crypto {

md5::md5() : context_{EVP_MD_CTX_new(), EVP_MD_CTX_free} {
  if (!context_) {
    throw std::runtime_error{"EVP_MD_CTX_new failed"};
  }
  if (EVP_DigestInit_ex(context_.get(), EVP_md5(), nullptr) != 1) {
    throw std::runtime_error{"EVP_DigestInit_ex(md5) failed"};
  }
}

void md5::update(const ferry::schema::bytes_view_t& bytes) {
  if (bytes.empty()) {
    return;
  }
  if (EVP_DigestUpdate(context_.get(), bytes.data(), bytes.size()) != 1) {
    throw std::runtime_error{"EVP_DigestUpdate failed"};
  }
}

ferry::schema::bytes_t md5::finalize() {
  auto out = ferry::schema::bytes_t(EVP_MAX_MD_SIZE);
  auto length = 0u;
  if (EVP_DigestFinal_ex(context_.get(), out.data(), &length) != 1) {
    throw std::runtime_error{"EVP_DigestFinal_ex failed"};
  }
  out.resize(length);
  return out;
}

std::string md5::finalize_hex() {
  auto digest = finalize();
  return ferry::schema::to_hex(ferry::schema::make_bytes_view(digest));
}

std::string md5_hex(const ferry::schema::bytes_view_t& bytes) {
  auto hasher = md5{};
  hasher.update(bytes);
  return hasher.finalize_hex();
}

std::string multipart_etag(const std::vector<ferry::schema::bytes_t>& parts) {
  auto hasher = md5{};
  for (const auto& part : parts) {
    hasher.update(ferry::schema::make_bytes_view(part));
  }
  return hasher.finalize_hex() + "-" + std::to_string(parts.size());
}

}  // namespace ferry::crypto
