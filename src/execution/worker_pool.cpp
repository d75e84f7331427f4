#include <ferry/execution/worker_pool.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace ferry::execution {

worker_pool::worker_pool(const ferry::common::context& context,
                         std::size_t threads)
    : capacity_{std::max<std::size_t>(threads, 1)},
      logger_{context.logger("workers")} {
  threads_.reserve(capacity_);
  for (auto i = std::size_t{0}; i < capacity_; ++i) {
    threads_.emplace_back([this] { run(); });
  }
}

worker_pool::~worker_pool() {
  {
    auto lock = std::scoped_lock{mutex_};
    stopping_ = true;
  }
  work_ready_.notify_all();
  for (auto& thread : threads_) {
    thread.join();
  }
}

void worker_pool::submit(std::function<void()> task) {
  auto lock = std::unique_lock{mutex_};
  slot_free_.wait(lock, [this] { return in_flight_ < capacity_; });
  queue_.push_back(std::move(task));
  ++in_flight_;
  lock.unlock();
  work_ready_.notify_one();
}

void worker_pool::wait_idle() {
  auto lock = std::unique_lock{mutex_};
  slot_free_.wait(lock, [this] { return in_flight_ == 0; });
}

void worker_pool::run() {
  while (true) {
    auto task = std::function<void()>{};
    {
      auto lock = std::unique_lock{mutex_};
      work_ready_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
    }

    try {
      task();
    } catch (const std::exception& e) {
      logger_->error("worker task failed: {}", e.what());
    }

    {
      auto lock = std::scoped_lock{mutex_};
      --in_flight_;
    }
    slot_free_.notify_all();
  }
}

}  // namespace ferry::execution
