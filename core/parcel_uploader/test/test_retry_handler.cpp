// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for RetryHandler
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <set>
#include <vector>

#include "retry_handler.hpp"

using namespace parcel::uploader;

class RetryHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.max_retries = 3;
    config_.initial_delay = std::chrono::milliseconds(200);
    config_.max_delay = std::chrono::milliseconds(1000);
    config_.exponential_base = 2.0;
    config_.jitter = false;  // deterministic delays
    handler_ = std::make_unique<RetryHandler>(config_, [this](std::chrono::milliseconds delay) {
      sleeps_.push_back(delay.count());
    });
  }

  RetryConfig config_;
  std::unique_ptr<RetryHandler> handler_;
  std::vector<int64_t> sleeps_;
};

// =============================================================================
// Backoff
// =============================================================================

TEST_F(RetryHandlerTest, ExponentialBackoffCappedAtMaxDelay) {
  EXPECT_EQ(handler_->getDelay(0).count(), 200);
  EXPECT_EQ(handler_->getDelay(1).count(), 400);
  EXPECT_EQ(handler_->getDelay(2).count(), 800);
  EXPECT_EQ(handler_->getDelay(3).count(), 1000);
  EXPECT_EQ(handler_->getDelay(20).count(), 1000);
}

TEST_F(RetryHandlerTest, JitterStaysWithinRange) {
  RetryConfig config;
  config.initial_delay = std::chrono::milliseconds(1000);
  config.max_delay = std::chrono::milliseconds(10000);
  config.jitter = true;
  config.jitter_factor = 0.5;
  RetryHandler handler(config);

  std::set<int64_t> delays;
  for (int i = 0; i < 100; ++i) {
    delays.insert(handler.getDelay(0).count());
  }

  EXPECT_GT(delays.size(), 1u);
  for (auto delay : delays) {
    EXPECT_GE(delay, 500);
    EXPECT_LE(delay, 1500);
  }
}

TEST_F(RetryHandlerTest, DelayIsAtLeastOneMillisecond) {
  RetryConfig config;
  config.initial_delay = std::chrono::milliseconds(0);
  config.jitter = false;
  RetryHandler handler(config);

  EXPECT_EQ(handler.getDelay(0).count(), 1);
}

TEST_F(RetryHandlerTest, ShouldRetryUntilMaxRetries) {
  EXPECT_TRUE(handler_->shouldRetry(0));
  EXPECT_TRUE(handler_->shouldRetry(2));
  EXPECT_FALSE(handler_->shouldRetry(3));
  EXPECT_EQ(handler_->maxRetries(), 3);
}

TEST_F(RetryHandlerTest, DefaultConfig) {
  RetryConfig config;
  EXPECT_EQ(config.max_retries, 3);
  EXPECT_EQ(config.initial_delay.count(), 200);
  EXPECT_EQ(config.max_delay.count(), 5000);
  EXPECT_TRUE(config.jitter);
}

// =============================================================================
// Error classification
// =============================================================================

TEST_F(RetryHandlerTest, TransientErrorsAreRetryable) {
  EXPECT_TRUE(RetryHandler::isRetryableError("RequestTimeout"));
  EXPECT_TRUE(RetryHandler::isRetryableError("ServiceUnavailable"));
  EXPECT_TRUE(RetryHandler::isRetryableError("InternalError"));
  EXPECT_TRUE(RetryHandler::isRetryableError("SlowDown"));
  EXPECT_TRUE(RetryHandler::isRetryableError("ConnectionReset"));
  EXPECT_TRUE(RetryHandler::isRetryableError("NetworkingError"));
  EXPECT_TRUE(RetryHandler::isRetryableError("ThrottlingException"));
}

TEST_F(RetryHandlerTest, PermanentErrorsAreNotRetryable) {
  EXPECT_FALSE(RetryHandler::isRetryableError("AccessDenied"));
  EXPECT_FALSE(RetryHandler::isRetryableError("NoSuchBucket"));
  EXPECT_FALSE(RetryHandler::isRetryableError("NoSuchUpload"));
  EXPECT_FALSE(RetryHandler::isRetryableError("EntityTooSmall"));
  EXPECT_FALSE(RetryHandler::isRetryableError("InvalidPart"));
  EXPECT_FALSE(RetryHandler::isRetryableError(""));
}

// =============================================================================
// execute()
// =============================================================================

TEST_F(RetryHandlerTest, ExecuteReturnsFirstSuccess) {
  int attempts = 0;
  auto result = handler_->execute("UploadPart", [&]() {
    ++attempts;
    return StoreResult::Success("etag");
  });

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.value, "etag");
  EXPECT_EQ(attempts, 1);
  EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RetryHandlerTest, ExecuteRetriesTransientErrors) {
  int attempts = 0;
  auto result = handler_->execute("UploadPart", [&]() {
    ++attempts;
    if (attempts < 3) {
      return StoreResult::Failure("Please reduce your request rate", "SlowDown");
    }
    return StoreResult::Success("etag");
  });

  EXPECT_TRUE(result.success);
  EXPECT_EQ(attempts, 3);
  EXPECT_EQ(sleeps_, (std::vector<int64_t>{200, 400}));
}

TEST_F(RetryHandlerTest, ExecuteHonoursRetryableFlag) {
  int attempts = 0;
  auto result = handler_->execute("UploadPart", [&]() {
    ++attempts;
    if (attempts == 1) {
      return StoreResult::Failure("socket closed", "Http0", true);
    }
    return StoreResult::Success("etag");
  });

  EXPECT_TRUE(result.success);
  EXPECT_EQ(attempts, 2);
}

TEST_F(RetryHandlerTest, ExecuteStopsOnPermanentError) {
  int attempts = 0;
  auto result = handler_->execute("CreateMultipartUpload", [&]() {
    ++attempts;
    return StoreResult::Failure("Access Denied", "AccessDenied");
  });

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_code, "AccessDenied");
  EXPECT_EQ(attempts, 1);
  EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RetryHandlerTest, ExecuteGivesUpAfterMaxRetries) {
  int attempts = 0;
  auto result = handler_->execute("UploadPart", [&]() {
    ++attempts;
    return StoreResult::Failure("We encountered an internal error", "InternalError");
  });

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_code, "InternalError");
  EXPECT_EQ(attempts, 4);  // first attempt + 3 retries
  EXPECT_EQ(sleeps_.size(), 3u);
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
