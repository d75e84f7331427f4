#include <ferry/common/context.hpp>

#include <spdlog/async_logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <array>
#include <filesystem>
#include <utility>

namespace ferry::common {

namespace {

constexpr auto kLevelNames = std::array<std::string_view, 8>{
    "trace", "debug", "info", "warn", "warning", "error", "critical", "off"};

spdlog::level::level_enum parse_level(std::string_view level) {
  if (level == "warning") {
    return spdlog::level::warn;
  }
  return spdlog::level::from_str(std::string{level});
}

}  // namespace

context::context(std::vector<spdlog::sink_ptr> sinks,
                 spdlog::level::level_enum level,
                 std::shared_ptr<spdlog::details::thread_pool> thread_pool)
    : sinks_{std::move(sinks)},
      level_{level},
      thread_pool_{std::move(thread_pool)} {}

context::~context() {
  flush();
}

std::shared_ptr<spdlog::logger> context::logger(
    std::string_view component) const {
  auto name = "ferry." + std::string{component};
  auto out = std::shared_ptr<spdlog::logger>{};
  if (thread_pool_) {
    out = std::make_shared<spdlog::async_logger>(
        std::move(name), std::begin(sinks_), std::end(sinks_), thread_pool_,
        spdlog::async_overflow_policy::block);
  } else {
    out = std::make_shared<spdlog::logger>(std::move(name), std::begin(sinks_),
                                           std::end(sinks_));
  }
  out->set_level(level_);
  if (!pattern_.empty()) {
    out->set_pattern(pattern_);
  }
  out->flush_on(spdlog::level::warn);
  return out;
}

void context::flush() const {
  for (const auto& sink : sinks_) {
    sink->flush();
  }
}

std::unique_ptr<context> make_context(const log_settings& settings) {
  auto sinks = std::vector<spdlog::sink_ptr>{};
  if (settings.console) {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }
  if (!settings.file.empty()) {
    auto file = std::filesystem::path{settings.file};
    if (file.has_parent_path()) {
      std::filesystem::create_directories(file.parent_path());
    }
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        file.string(), settings.max_size_mb * 1024 * 1024,
        settings.backup_count));
  }

  auto thread_pool = std::shared_ptr<spdlog::details::thread_pool>{};
  if (settings.async) {
    thread_pool = std::make_shared<spdlog::details::thread_pool>(8192, 1);
  }

  auto out = std::make_unique<context>(std::move(sinks),
                                       parse_level(settings.level),
                                       std::move(thread_pool));
  out->pattern_ = settings.pattern;
  return out;
}

bool is_valid_log_level(std::string_view level) {
  return std::find(std::begin(kLevelNames), std::end(kLevelNames), level) !=
         std::end(kLevelNames);
}

}  // namespace ferry::common
