// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "retry_handler.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <set>
#include <thread>
#include <utility>

#define PARCEL_LOG_COMPONENT "retry"
#include <parcel_log_macros.hpp>

namespace parcel {
namespace uploader {

using ::parcel::logging::kv;

RetryHandler::RetryHandler(const RetryConfig& config, SleepFunction sleep)
    : config_(config)
    , sleep_(std::move(sleep))
    , rng_(std::random_device{}()) {
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds delay) {
      std::this_thread::sleep_for(delay);
    };
  }
}

std::chrono::milliseconds RetryHandler::getDelay(int retry_count) const {
  double delay_ms = static_cast<double>(config_.initial_delay.count()) *
                    std::pow(config_.exponential_base, static_cast<double>(retry_count));
  delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));

  if (config_.jitter) {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<> dist(1.0 - config_.jitter_factor, 1.0 + config_.jitter_factor);
    delay_ms *= dist(rng_);
  }

  delay_ms = std::max(delay_ms, 1.0);
  return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

StoreResult RetryHandler::execute(
  const std::string& operation, const std::function<StoreResult()>& attempt
) const {
  int retry_count = 0;
  while (true) {
    StoreResult result = attempt();
    if (result.success) {
      if (retry_count > 0) {
        PARCEL_LOG_INFO(
          "Request succeeded after retry" << kv("operation", operation)
                                          << kv("retries", retry_count)
        );
      }
      return result;
    }

    const bool retryable = result.is_retryable || isRetryableError(result.error_code);
    if (!retryable || !shouldRetry(retry_count)) {
      return result;
    }

    auto delay = getDelay(retry_count);
    PARCEL_LOG_WARN(
      "Transient store error, retrying"
      << kv("operation", operation) << kv("code", result.error_code)
      << kv("error", result.error_message) << kv("attempt", retry_count + 1)
      << kv("delay_ms", delay.count())
    );
    sleep_(delay);
    ++retry_count;
  }
}

bool RetryHandler::isRetryableError(const std::string& error_code) {
  static const std::set<std::string> retryable = {
    // S3 / HTTP
    "RequestTimeout",
    "ServiceUnavailable",
    "InternalError",
    "SlowDown",
    "RequestTimeTooSkewed",
    "OperationAborted",

    // Network
    "ConnectionReset",
    "ConnectionTimeout",
    "ConnectionRefused",
    "NetworkingError",

    // Throttling
    "Throttling",
    "ThrottlingException",
    "TransientError"
  };
  return retryable.count(error_code) > 0;
}

}  // namespace uploader
}  // namespace parcel
