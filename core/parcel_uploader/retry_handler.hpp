// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_RETRY_HANDLER_HPP
#define PARCEL_RETRY_HANDLER_HPP

#include <chrono>
#include <functional>
#include <mutex>
#include <random>
#include <string>

#include "upload_types.hpp"

namespace parcel {
namespace uploader {

/**
 * Retry policy for transient store errors
 */
struct RetryConfig {
  int max_retries = 3;                           // Retries after the first attempt
  std::chrono::milliseconds initial_delay{200};
  std::chrono::milliseconds max_delay{5000};
  double exponential_base = 2.0;
  bool jitter = true;
  double jitter_factor = 0.5;                    // Jitter range: [1-factor, 1+factor]
};

/**
 * Exponential backoff with jitter for single store requests
 *
 * Used by the store client around each HTTP call. The upload core itself
 * never retries; a part that still fails after the retries here is
 * reported as failed.
 *
 * Thread-safe: workers share one handler.
 */
class RetryHandler {
public:
  using SleepFunction = std::function<void(std::chrono::milliseconds)>;

  /**
   * @param config Retry policy
   * @param sleep Wait between attempts; defaults to std::this_thread::sleep_for
   */
  explicit RetryHandler(const RetryConfig& config = {}, SleepFunction sleep = nullptr);

  /**
   * Delay before retry number retry_count (0-indexed):
   * initial_delay * base^retry_count, capped at max_delay, times jitter
   */
  std::chrono::milliseconds getDelay(int retry_count) const;

  bool shouldRetry(int retry_count) const {
    return retry_count < config_.max_retries;
  }

  int maxRetries() const {
    return config_.max_retries;
  }

  /**
   * Run an attempt until it succeeds, fails permanently, or the retries
   * are used up
   *
   * @param operation Name for log lines
   * @param attempt One request; a failure is retried when it is flagged
   *        retryable or its code is a known transient error
   * @return Result of the last attempt
   */
  StoreResult execute(const std::string& operation, const std::function<StoreResult()>& attempt)
    const;

  /**
   * True for transient S3, HTTP and network error codes
   */
  static bool isRetryableError(const std::string& error_code);

  const RetryConfig& config() const {
    return config_;
  }

private:
  RetryConfig config_;
  SleepFunction sleep_;
  mutable std::mt19937 rng_;
  mutable std::mutex rng_mutex_;
};

}  // namespace uploader
}  // namespace parcel

#endif  // PARCEL_RETRY_HANDLER_HPP
