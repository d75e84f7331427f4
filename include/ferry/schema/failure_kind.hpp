#pragma once

#include <ferry/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>

// Schema type: failure kind.
// `transient` and `integrity` failures are retried; `size_limit` is not.
namespace ferry::schema {

enum class failure_kind_t : uint8_t {
  none = 0,
  transient = 1,
  integrity = 2,
  size_limit = 3
};

inline constexpr auto kFailureKindMappings =
    enum_mappings_t<failure_kind_t, 4>{{
        {"none", failure_kind_t::none},
        {"transient", failure_kind_t::transient},
        {"integrity", failure_kind_t::integrity},
        {"size_limit", failure_kind_t::size_limit},
    }};

template <>
inline std::optional<failure_kind_t> try_from_string<failure_kind_t>(
    const std::string_view value) {
  return from_string(value, kFailureKindMappings);
}

inline constexpr std::string_view to_string(const failure_kind_t value) {
  return to_string(value, kFailureKindMappings, "unknown");
}

}  // namespace ferry::schema
