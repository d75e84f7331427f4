#pragma once

#include <ferry/schema/primitives.hpp>

#include <chrono>
#include <cstdint>

// Schema type: sync statistics.
// Outcome counters for one pass. Never persisted.
namespace ferry::schema {

template <uint16_t Version>
struct sync_statistics;

template <>
struct sync_statistics<1> final {
  uint64_t files_found{};
  uint64_t files_transferred{};
  uint64_t files_skipped{};
  uint64_t files_failed{};
  byte_count_t bytes_transferred{};
  std::chrono::milliseconds elapsed{};
};

using sync_statistics_t = sync_statistics<1>;

}  // namespace ferry::schema
