#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using mutable_bytes_view_t = std::span<uint8_t>;
using timestamp_t = std::chrono::system_clock::time_point;
using duration_milliseconds_t = std::chrono::milliseconds;
using byte_count_t = uint64_t;

bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Drop sub-microsecond digits, the finest precision `to_iso8601` keeps.
timestamp_t to_stored_precision(const timestamp_t& value);

/// Format as ISO-8601 UTC, e.g. `2024-03-01T10:15:30.250000Z`.
std::string to_iso8601(const timestamp_t& value);

/// Parse ISO-8601. Accepts a trailing `Z`, a `±HH:MM` offset, or no zone
/// designator (read as UTC). Returns std::nullopt on malformed input.
std::optional<timestamp_t> try_parse_iso8601(std::string_view value);

/// Format a UTC calendar date with a strftime-style pattern.
std::string format_utc(const timestamp_t& value, const std::string& pattern);

/// Binary-unit size with two decimals ("1.50 MB").
std::string format_size(byte_count_t bytes);

/// Lowercase hex encoding.
std::string to_hex(const bytes_view_t& bytes);

}  // namespace ferry::schema
