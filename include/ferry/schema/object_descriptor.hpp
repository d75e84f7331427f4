#pragma once

#include <ferry/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: remote object descriptor.
// One listing entry from a source catalog; lives only for the current pass.
namespace ferry::schema {

template <uint16_t Version>
struct object_descriptor;

template <>
struct object_descriptor<1> final {
  std::string name;
  byte_count_t size{};
  std::optional<timestamp_t> created_at;
};

using object_descriptor_t = object_descriptor<1>;

}  // namespace ferry::schema
