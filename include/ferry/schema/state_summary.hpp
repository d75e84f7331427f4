#pragma once

#include <ferry/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace ferry::schema {

template <uint16_t Version>
struct state_summary;

template <>
struct state_summary<1> final {
  uint64_t total_files{};
  byte_count_t total_bytes{};
  std::optional<timestamp_t> last_sync_at;
};

using state_summary_t = state_summary<1>;

}  // namespace ferry::schema
