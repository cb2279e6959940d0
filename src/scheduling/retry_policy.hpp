#ifndef RETRY_POLICY_HPP
#define RETRY_POLICY_HPP

#include "core/config.hpp"

#include <chrono>
#include <cstdint>

namespace scheduling {

// Bounded exponential backoff: delay = base * 2^attempt, capped.
struct RetryPolicy {
  uint32_t max_retries = 3;
  std::chrono::milliseconds backoff_base = std::chrono::milliseconds(1000);
  std::chrono::milliseconds backoff_cap = std::chrono::milliseconds(60000);

  std::chrono::milliseconds delay_for(uint32_t attempt) const {
    const int64_t base = backoff_base.count();
    const int64_t cap = backoff_cap.count();
    int64_t delay = base;
    for (uint32_t i = 0; i < attempt && delay < cap; ++i)
      delay *= 2;
    return std::chrono::milliseconds(delay < cap ? delay : cap);
  }

  static RetryPolicy from_config(const Config::RetryPolicyConfig &config) {
    RetryPolicy policy;
    policy.max_retries = config.max_retries;
    policy.backoff_base = std::chrono::milliseconds(config.backoff_base_ms);
    policy.backoff_cap = std::chrono::milliseconds(config.backoff_cap_ms);
    return policy;
  }
};

} // namespace scheduling

#endif // RETRY_POLICY_HPP
