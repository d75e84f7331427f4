#pragma once

#include <ferry/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>

// Schema type: scheduler state.
// idle -> syncing -> sleeping -> idle, with `stopped` terminal once a stop
// request has been observed.
namespace ferry::schema {

enum class scheduler_state_t : uint8_t {
  idle = 0,
  syncing = 1,
  sleeping = 2,
  stopped = 3
};

inline constexpr auto kSchedulerStateMappings =
    enum_mappings_t<scheduler_state_t, 4>{{
        {"idle", scheduler_state_t::idle},
        {"syncing", scheduler_state_t::syncing},
        {"sleeping", scheduler_state_t::sleeping},
        {"stopped", scheduler_state_t::stopped},
    }};

template <>
inline std::optional<scheduler_state_t> try_from_string<scheduler_state_t>(
    const std::string_view value) {
  return from_string(value, kSchedulerStateMappings);
}

inline constexpr std::string_view to_string(const scheduler_state_t value) {
  return to_string(value, kSchedulerStateMappings, "unknown");
}

}  // namespace ferry::schema
