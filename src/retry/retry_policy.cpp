#include <ferry/retry/retry_policy.hpp>

#include <algorithm>
#include <cmath>

namespace ferry::retry {

retry_policy::retry_policy(retry_options options) : options_{options} {}

std::chrono::milliseconds retry_policy::next_delay(uint32_t n) const {
  auto exponent = n > 0 ? static_cast<double>(n - 1) : 0.0;
  auto delay = static_cast<double>(options_.initial_delay.count()) *
               std::pow(options_.backoff_multiplier, exponent);
  auto ceiling = static_cast<double>(options_.max_delay.count());
  // pow() overflows to inf long before the cast would be meaningful.
  if (!std::isfinite(delay) || delay > ceiling) {
    return options_.max_delay;
  }
  return std::chrono::milliseconds{static_cast<int64_t>(std::max(delay, 0.0))};
}

bool retry_policy::should_retry(uint32_t n) const {
  return n <= options_.max_retries;
}

uint32_t retry_policy::max_attempts() const {
  return options_.max_retries + 1;
}

const retry_options& retry_policy::options() const {
  return options_;
}

}  // namespace ferry::retry
