#pragma once

#include <ferry/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: transfer record.
// Proof that `destination_key` held a copy of `source_name` as of
// `transferred_at`. Written only after the transfer it describes completed.
namespace ferry::schema {

template <uint16_t Version>
struct transfer_record;

template <>
struct transfer_record<1> final {
  std::string source_name;
  std::string destination_key;
  byte_count_t size{};
  std::optional<timestamp_t> created_at;
  timestamp_t transferred_at{};
  std::optional<std::string> checksum;
  double duration_seconds{};
};

using transfer_record_t = transfer_record<1>;

}  // namespace ferry::schema
