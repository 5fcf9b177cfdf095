// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_RETRY_HANDLER_HPP
#define CIRRUS_RETRY_HANDLER_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <mutex>
#include <random>

namespace cirrus {
namespace uploader {

/**
 * Backoff applied by the scheduler to batches that ended in RETRY
 */
struct RetryConfig {
  int max_retries = 10;                            // Re-runs of one batch before it is dropped
  std::chrono::milliseconds initial_delay{30000};  // 30 seconds
  std::chrono::milliseconds max_delay{18000000};   // 5 hours
  double exponential_base = 2.0;
  bool jitter = true;
  double jitter_factor = 0.2;  // Jitter range: [1-factor, 1+factor]
};

/**
 * Exponential backoff with optional jitter.
 *
 * Thread-safe: getDelay() may be called from several scheduler threads.
 */
class RetryHandler {
public:
  explicit RetryHandler(const RetryConfig& config = {})
      : config_(config)
      , rng_(std::random_device{}()) {}

  /**
   * Delay before the given attempt.
   *
   * initial_delay * base^retry_count, capped at max_delay, then scaled by a
   * random factor in [1 - jitter_factor, 1 + jitter_factor] when jitter is on.
   *
   * @param retry_count Zero-based retry attempt
   */
  std::chrono::milliseconds getDelay(int retry_count) const {
    double delay_ms = static_cast<double>(config_.initial_delay.count()) *
                      std::pow(config_.exponential_base, static_cast<double>(retry_count));

    delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));

    if (config_.jitter) {
      std::lock_guard<std::mutex> lock(rng_mutex_);
      std::uniform_real_distribution<> dist(
        1.0 - config_.jitter_factor, 1.0 + config_.jitter_factor
      );
      delay_ms *= dist(rng_);
    }

    delay_ms = std::max(delay_ms, 1.0);

    return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
  }

  /**
   * @return true if retry_count < max_retries. A negative max_retries
   *         means unlimited.
   */
  bool shouldRetry(int retry_count) const {
    return config_.max_retries < 0 || retry_count < config_.max_retries;
  }

  int maxRetries() const {
    return config_.max_retries;
  }

  std::chrono::steady_clock::time_point nextRetryTime(int retry_count) const {
    return std::chrono::steady_clock::now() + getDelay(retry_count);
  }

  const RetryConfig& config() const {
    return config_;
  }

private:
  RetryConfig config_;
  mutable std::mt19937 rng_;
  mutable std::mutex rng_mutex_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_RETRY_HANDLER_HPP
