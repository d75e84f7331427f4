#pragma once

#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/logger.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::common {

struct log_settings final {
  std::string level{"info"};
  std::string file;
  uint64_t max_size_mb{100};
  uint32_t backup_count{5};
  std::string pattern{"%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%n] %v"};
  bool console{true};
  bool async{false};
};

/// Shared runtime state handed to every component at construction.
///
/// Owns the log sinks (and, for async logging, the worker thread pool).
/// Components ask for a named logger once and keep the handle; nothing is
/// registered in spdlog's global registry. The context must outlive every
/// logger it hands out.
class context final {
 public:
  context(std::vector<spdlog::sink_ptr> sinks,
          spdlog::level::level_enum level,
          std::shared_ptr<spdlog::details::thread_pool> thread_pool = nullptr);

  context(const context&) = delete;
  context& operator=(const context&) = delete;
  ~context();

  /// Logger named `ferry.<component>` writing to this context's sinks.
  std::shared_ptr<spdlog::logger> logger(std::string_view component) const;

  spdlog::level::level_enum level() const { return level_; }

  void flush() const;

 private:
  std::vector<spdlog::sink_ptr> sinks_;
  spdlog::level::level_enum level_;
  std::string pattern_;
  std::shared_ptr<spdlog::details::thread_pool> thread_pool_;

  friend std::unique_ptr<context> make_context(const log_settings& settings);
};

/// Build console and optional rotating-file sinks from settings.
std::unique_ptr<context> make_context(const log_settings& settings);

/// True when `level` names an spdlog level ("trace" ... "off").
bool is_valid_log_level(std::string_view level);

}  // namespace ferry::common
