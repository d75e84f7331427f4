#pragma once
#include <ferry/schema/encoding/encoder.hpp>
#include <ferry/schema/encoding/json/state_snapshot.hpp>
#include <ferry/schema/encoding/json/transfer_record.hpp>
#include <nlohmann/json.hpp>

#include <exception>

namespace ferry::schema::encoding {

struct json_encoder_tag {};

template <>
struct encoder<json_encoder_tag> final {
  template <typename T>
  std::string encode(const T& obj);

  template <typename T>
  T decode(const std::string_view& document);

  /// Decode, returning std::nullopt instead of throwing on malformed input.
  template <typename T>
  std::optional<T> try_decode(const std::string_view& document);
};

template <typename T>
std::string encoder<json_encoder_tag>::encode(const T& obj) {
  auto document = nlohmann::json::object();
  json::encode(obj, document);
  return document.dump(2);
}

template <typename T>
T encoder<json_encoder_tag>::decode(const std::string_view& document) {
  auto parsed = nlohmann::json::parse(std::begin(document), std::end(document));
  auto obj = T{};
  json::decode(obj, parsed);
  return obj;
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(
    const std::string_view& document) {
  try {
    return decode<T>(document);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace ferry::schema::encoding
