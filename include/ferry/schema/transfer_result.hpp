#pragma once

#include <ferry/schema/failure_kind.hpp>
#include <ferry/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: transfer result.
// Outcome of one executor invocation, covering every attempt it made.
namespace ferry::schema {

template <uint16_t Version>
struct transfer_result;

template <>
struct transfer_result<1> final {
  bool success{};
  byte_count_t bytes_moved{};
  std::chrono::duration<double> duration{};
  uint32_t attempts{};
  failure_kind_t failure{failure_kind_t::none};
  std::optional<std::string> error;
  std::optional<std::string> checksum;
};

using transfer_result_t = transfer_result<1>;

}  // namespace ferry::schema
