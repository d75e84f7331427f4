#pragma once

#include <ferry/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>

// Schema type: sync phase.
// Stages a single pass moves through, in order. A pass that fails while
// listing goes straight back to `idle` without reaching `done`.
namespace ferry::schema {

enum class sync_phase_t : uint8_t {
  idle = 0,
  listing = 1,
  diffing = 2,
  transferring = 3,
  persisting = 4,
  cleanup = 5,
  done = 6
};

inline constexpr auto kSyncPhaseMappings = enum_mappings_t<sync_phase_t, 7>{{
    {"idle", sync_phase_t::idle},
    {"listing", sync_phase_t::listing},
    {"diffing", sync_phase_t::diffing},
    {"transferring", sync_phase_t::transferring},
    {"persisting", sync_phase_t::persisting},
    {"cleanup", sync_phase_t::cleanup},
    {"done", sync_phase_t::done},
}};

template <>
inline std::optional<sync_phase_t> try_from_string<sync_phase_t>(
    const std::string_view value) {
  return from_string(value, kSyncPhaseMappings);
}

inline constexpr std::string_view to_string(const sync_phase_t value) {
  return to_string(value, kSyncPhaseMappings, "unknown");
}

}  // namespace ferry::schema
