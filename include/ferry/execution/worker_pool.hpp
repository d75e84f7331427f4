#pragma once

#include <ferry/common/context.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace ferry::execution {

/// Fixed set of worker threads with no backlog.
///
/// submit() blocks while every worker is occupied, so at most `size()` tasks
/// are ever queued or running. A task that throws is logged and dropped; it
/// never takes its worker down.
class worker_pool final {
 public:
  worker_pool(const ferry::common::context& context, std::size_t threads);
  ~worker_pool();

  worker_pool(const worker_pool&) = delete;
  worker_pool& operator=(const worker_pool&) = delete;

  void submit(std::function<void()> task);

  /// Block until every submitted task has finished.
  void wait_idle();

  std::size_t size() const { return threads_.size(); }

 private:
  void run();

  std::mutex mutex_;
  std::condition_variable work_ready_;
  std::condition_variable slot_free_;
  std::deque<std::function<void()>> queue_;
  std::size_t in_flight_{0};
  std::size_t capacity_;
  bool stopping_{false};
  std::vector<std::thread> threads_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ferry::execution
