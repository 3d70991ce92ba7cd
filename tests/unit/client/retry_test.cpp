/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "client/retry.hpp"

using namespace std::chrono_literals;
using shardkv::client::Context;
using shardkv::client::Retry;
using shardkv::client::RetryOptions;

namespace {
  RetryOptions fastOptions(size_t max_retries) {
    RetryOptions options;
    options.initial_backoff = 1ms;
    options.max_backoff = 4ms;
    options.max_retries = max_retries;
    return options;
  }
}  // namespace

/**
 * @given retry options allowing 3 retries
 * @when attempts are made until next() refuses
 * @then the first attempt plus 3 retries are allowed
 */
TEST(RetryTest, MaxRetries) {
  Retry retry(Context::background(), fastOptions(3));
  size_t attempts = 0;
  while (retry.next()) {
    ++attempts;
  }
  EXPECT_EQ(attempts, 4);
  EXPECT_EQ(retry.currentAttempt(), 3);
}

/**
 * @given an exhausted retry
 * @when it is reset
 * @then the next attempt happens immediately and counting restarts
 */
TEST(RetryTest, Reset) {
  Retry retry(Context::background(), fastOptions(1));
  EXPECT_TRUE(retry.next());
  EXPECT_TRUE(retry.next());
  EXPECT_FALSE(retry.next());
  retry.reset();
  EXPECT_EQ(retry.currentAttempt(), 0);
  EXPECT_TRUE(retry.next());
}

/**
 * @given a cancelled context
 * @when a retry is requested
 * @then only the first attempt is allowed
 */
TEST(RetryTest, CancelledContextStops) {
  auto ctx = Context::background().withCancel();
  Retry retry(ctx, fastOptions(0));
  EXPECT_TRUE(retry.next());
  ctx.cancel();
  EXPECT_FALSE(retry.next());
}

/**
 * @given a multiplier of 2 and a maximal backoff
 * @when the backoff is computed for successive attempts
 * @then it grows and stays within the jitter around the maximum
 */
TEST(RetryTest, BackoffIsBounded) {
  auto options = fastOptions(0);
  options.initial_backoff = 10ms;
  options.max_backoff = 40ms;
  options.randomization_factor = 0;
  Retry retry(Context::background(), options);
  EXPECT_EQ(retry.retryIn(), 10ms);
  ASSERT_TRUE(retry.next());
  ASSERT_TRUE(retry.next());
  EXPECT_EQ(retry.retryIn(), 20ms);

  options.initial_backoff = 1s;
  options.max_backoff = 2s;
  options.randomization_factor = 0.5;
  Retry jittered(Context::background(), options);
  for (auto i = 0; i < 10; ++i) {
    auto backoff = jittered.retryIn();
    EXPECT_GE(backoff, 500ms);
    EXPECT_LE(backoff, 1500ms);
  }
}
