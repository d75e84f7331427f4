#pragma once

#include <ferry/common/context.hpp>
#include <ferry/schema/primitives.hpp>

#include <spdlog/sinks/null_sink.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ferry::testing {

/// Context whose loggers write nowhere.
inline std::unique_ptr<ferry::common::context> make_test_context() {
  return std::make_unique<ferry::common::context>(
      std::vector<spdlog::sink_ptr>{
          std::make_shared<spdlog::sinks::null_sink_mt>()},
      spdlog::level::trace);
}

inline std::filesystem::path make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         (std::string{prefix} + "_" +
          std::to_string(static_cast<unsigned long long>(now)));
}

inline void remove_path(const std::filesystem::path& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Fresh directory under the system temp dir, removed on destruction.
struct temp_directory final {
  explicit temp_directory(const std::string_view prefix)
      : path{make_temp_path(prefix)} {
    std::filesystem::create_directories(path);
  }
  ~temp_directory() { remove_path(path); }

  temp_directory(const temp_directory&) = delete;
  temp_directory& operator=(const temp_directory&) = delete;

  std::filesystem::path path;
};

inline void write_file(const std::filesystem::path& path,
                       const std::string_view content) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
  out << content;
}

inline std::optional<std::string> read_file(
    const std::filesystem::path& path) {
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) {
    return std::nullopt;
  }
  return std::string{std::istreambuf_iterator<char>{in},
                     std::istreambuf_iterator<char>{}};
}

/// UTC wall-clock instant.
inline ferry::schema::timestamp_t at(int year,
                                     unsigned month,
                                     unsigned day,
                                     int hour = 0,
                                     int minute = 0,
                                     int second = 0) {
  auto date = std::chrono::sys_days{std::chrono::year{year} /
                                    std::chrono::month{month} /
                                    std::chrono::day{day}};
  return date + std::chrono::hours{hour} + std::chrono::minutes{minute} +
         std::chrono::seconds{second};
}

/// Settable clock for components that take a clock function.
struct manual_clock final {
  ferry::schema::timestamp_t now{at(2024, 6, 1, 12)};

  std::function<ferry::schema::timestamp_t()> fn() {
    return [this] { return now; };
  }
};

}  // namespace ferry::testing
