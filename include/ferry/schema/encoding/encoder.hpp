#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace ferry::schema::encoding {

// The document format is a build-time choice: callers spell out the tag
// (`encoder<json_encoder_tag>`) and never switch at runtime.
template <typename Library>
struct encoder {
  template <typename T>
  std::string encode(const T& obj);

  template <typename T>
  T decode(const std::string_view& document);

  template <typename T>
  std::optional<T> try_decode(const std::string_view& document);
};

}  // namespace ferry::schema::encoding
