#include <ferry/retry/retry_policy.hpp>
#include <gtest/gtest.h>

#include <chrono>

using namespace std::chrono_literals;

TEST(retry_policy, delays_grow_geometrically_until_capped) {
  auto policy = ferry::retry::retry_policy{ferry::retry::retry_options{
      .max_retries = 10,
      .initial_delay = 5s,
      .backoff_multiplier = 2.0,
      .max_delay = 60s}};
  EXPECT_EQ(policy.next_delay(1), 5s);
  EXPECT_EQ(policy.next_delay(2), 10s);
  EXPECT_EQ(policy.next_delay(3), 20s);
  EXPECT_EQ(policy.next_delay(4), 40s);
  EXPECT_EQ(policy.next_delay(5), 60s);
  EXPECT_EQ(policy.next_delay(9), 60s);
}

TEST(retry_policy, huge_attempt_numbers_stay_at_the_cap) {
  auto policy = ferry::retry::retry_policy{ferry::retry::retry_options{
      .max_retries = 3,
      .initial_delay = 1s,
      .backoff_multiplier = 10.0,
      .max_delay = 300s}};
  EXPECT_EQ(policy.next_delay(5000), 300s);
}

TEST(retry_policy, multiplier_of_one_is_constant) {
  auto policy = ferry::retry::retry_policy{ferry::retry::retry_options{
      .max_retries = 3,
      .initial_delay = 1500ms,
      .backoff_multiplier = 1.0,
      .max_delay = 300s}};
  EXPECT_EQ(policy.next_delay(1), 1500ms);
  EXPECT_EQ(policy.next_delay(3), 1500ms);
}

TEST(retry_policy, retries_allowed_up_to_max) {
  auto policy = ferry::retry::retry_policy{
      ferry::retry::retry_options{.max_retries = 2}};
  EXPECT_TRUE(policy.should_retry(1));
  EXPECT_TRUE(policy.should_retry(2));
  EXPECT_FALSE(policy.should_retry(3));
  EXPECT_EQ(policy.max_attempts(), 3u);
}

TEST(retry_policy, zero_retries_means_single_attempt) {
  auto policy = ferry::retry::retry_policy{
      ferry::retry::retry_options{.max_retries = 0}};
  EXPECT_FALSE(policy.should_retry(1));
  EXPECT_EQ(policy.max_attempts(), 1u);
}

TEST(retry_policy, defaults_match_documented_values) {
  auto policy = ferry::retry::retry_policy{};
  EXPECT_EQ(policy.options().max_retries, 3u);
  EXPECT_EQ(policy.next_delay(1), 5s);
  EXPECT_EQ(policy.next_delay(2), 10s);
  EXPECT_EQ(policy.next_delay(10), 300s);
}
