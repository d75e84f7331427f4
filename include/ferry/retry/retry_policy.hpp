#pragma once

#include <chrono>
#include <cstdint>

namespace ferry::retry {

struct retry_options final {
  uint32_t max_retries{3};
  std::chrono::milliseconds initial_delay{std::chrono::seconds{5}};
  double backoff_multiplier{2.0};
  std::chrono::milliseconds max_delay{std::chrono::seconds{300}};
};

/// Exponential backoff without jitter.
///
/// Retry `n` is the n-th try after the initial failure, so a policy allows at
/// most `max_retries + 1` tries in total.
class retry_policy final {
 public:
  explicit retry_policy(retry_options options = {});

  /// min(initial_delay * backoff_multiplier^(n-1), max_delay).
  std::chrono::milliseconds next_delay(uint32_t n) const;

  bool should_retry(uint32_t n) const;

  uint32_t max_attempts() const;

  const retry_options& options() const;

 private:
  retry_options options_;
};

}  // namespace ferry::retry
