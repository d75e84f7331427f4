#pragma once

#include <ferry/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace ferry::schema {

template <uint16_t Version>
struct object_metadata;

/// Destination-side view of a stored object.
template <>
struct object_metadata<1> final {
  byte_count_t size{};
  std::string checksum;
  std::optional<timestamp_t> last_modified;
};

using object_metadata_t = object_metadata<1>;

}  // namespace ferry::schema
