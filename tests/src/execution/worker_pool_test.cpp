#include <ferry/execution/worker_pool.hpp>
#include <ferry/testing/common.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

TEST(worker_pool, runs_every_submitted_task) {
  auto context = ferry::testing::make_test_context();
  auto done = std::atomic<int>{0};
  {
    auto pool = ferry::execution::worker_pool{*context, 3};
    EXPECT_EQ(pool.size(), 3u);
    for (auto i = 0; i < 20; ++i) {
      pool.submit([&done] { ++done; });
    }
    pool.wait_idle();
    EXPECT_EQ(done.load(), 20);
  }
}

TEST(worker_pool, never_runs_more_tasks_than_threads) {
  auto context = ferry::testing::make_test_context();
  auto active = std::atomic<int>{0};
  auto peak = std::atomic<int>{0};
  auto pool = ferry::execution::worker_pool{*context, 2};
  for (auto i = 0; i < 8; ++i) {
    pool.submit([&] {
      auto now = ++active;
      auto seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds{20});
      --active;
    });
  }
  pool.wait_idle();
  EXPECT_LE(peak.load(), 2);
  EXPECT_GE(peak.load(), 1);
}

TEST(worker_pool, throwing_task_does_not_stop_the_worker) {
  auto context = ferry::testing::make_test_context();
  auto done = std::atomic<int>{0};
  auto pool = ferry::execution::worker_pool{*context, 1};
  pool.submit([] { throw std::runtime_error{"boom"}; });
  pool.submit([&done] { ++done; });
  pool.wait_idle();
  EXPECT_EQ(done.load(), 1);
}

TEST(worker_pool, zero_threads_still_gets_one_worker) {
  auto context = ferry::testing::make_test_context();
  auto pool = ferry::execution::worker_pool{*context, 0};
  EXPECT_EQ(pool.size(), 1u);
  auto ran = std::atomic<bool>{false};
  pool.submit([&ran] { ran = true; });
  pool.wait_idle();
  EXPECT_TRUE(ran.load());
}

TEST(worker_pool, wait_idle_returns_immediately_when_empty) {
  auto context = ferry::testing::make_test_context();
  auto pool = ferry::execution::worker_pool{*context, 2};
  pool.wait_idle();
  SUCCEED();
}
