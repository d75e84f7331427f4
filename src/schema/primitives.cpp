#include <boost/date_time/posix_time/posix_time.hpp>
#include <ferry/schema/primitives.hpp>

#include <array>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <ctime>
#include <exception>

namespace ferry::schema {

namespace {

const auto kEpoch =
    boost::posix_time::ptime{boost::gregorian::date{1970, 1, 1}};

boost::posix_time::ptime to_ptime(const timestamp_t& value) {
  auto micros = std::chrono::floor<std::chrono::microseconds>(
                    value.time_since_epoch())
                    .count();
  return kEpoch + boost::posix_time::microseconds{micros};
}

timestamp_t from_ptime(const boost::posix_time::ptime& value) {
  auto micros = (value - kEpoch).total_microseconds();
  return timestamp_t{std::chrono::microseconds{micros}};
}

std::optional<int> parse_two_digits(std::string_view digits) {
  auto out = 0;
  auto [end, error] =
      std::from_chars(digits.data(), digits.data() + digits.size(), out);
  if (error != std::errc{} || end != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return out;
}

}  // namespace

timestamp_t to_stored_precision(const timestamp_t& value) {
  return std::chrono::floor<std::chrono::microseconds>(value);
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_iso8601(const timestamp_t& value) {
  return boost::posix_time::to_iso_extended_string(to_ptime(value)) + "Z";
}

std::optional<timestamp_t> try_parse_iso8601(std::string_view value) {
  if (value.size() < 19) {
    return std::nullopt;
  }

  auto offset = std::chrono::minutes{0};
  if (value.back() == 'Z' || value.back() == 'z') {
    value.remove_suffix(1);
  } else if (value.size() >= 25) {
    // Trailing "+HH:MM" / "-HH:MM" after the seconds field.
    auto zone = value.substr(value.size() - 6);
    if ((zone[0] == '+' || zone[0] == '-') && zone[3] == ':') {
      auto hours = parse_two_digits(zone.substr(1, 2));
      auto minutes = parse_two_digits(zone.substr(4, 2));
      if (!hours || !minutes) {
        return std::nullopt;
      }
      offset = std::chrono::hours{*hours} + std::chrono::minutes{*minutes};
      if (zone[0] == '-') {
        offset = -offset;
      }
      value.remove_suffix(6);
    }
  }

  try {
    auto parsed =
        boost::posix_time::from_iso_extended_string(std::string{value});
    if (parsed.is_special()) {
      return std::nullopt;
    }
    return from_ptime(parsed) - offset;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::string format_utc(const timestamp_t& value, const std::string& pattern) {
  auto seconds = std::chrono::system_clock::to_time_t(value);
  auto calendar = std::tm{};
  gmtime_r(&seconds, &calendar);
  auto buffer = std::array<char, 128>{};
  auto written =
      std::strftime(buffer.data(), buffer.size(), pattern.c_str(), &calendar);
  return std::string{buffer.data(), written};
}

std::string format_size(byte_count_t bytes) {
  static constexpr auto kUnits = std::array{"B", "KB", "MB", "GB"};
  auto size = static_cast<double>(bytes);
  for (const auto* unit : kUnits) {
    if (size < 1024.0) {
      auto buffer = std::array<char, 32>{};
      std::snprintf(buffer.data(), buffer.size(), "%.2f %s", size, unit);
      return buffer.data();
    }
    size /= 1024.0;
  }
  auto buffer = std::array<char, 32>{};
  std::snprintf(buffer.data(), buffer.size(), "%.2f TB", size);
  return buffer.data();
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kDigits = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    out.push_back(kDigits[byte >> 4u]);
    out.push_back(kDigits[byte & 0x0Fu]);
  }
  return out;
}

}  // namespace ferry::schema
