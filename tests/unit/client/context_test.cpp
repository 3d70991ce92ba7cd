/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "client/context.hpp"

using namespace std::chrono_literals;
using shardkv::client::Context;
using shardkv::client::ContextError;

TEST(ContextTest, BackgroundIsNeverDone) {
  auto ctx = Context::background();
  EXPECT_OUTCOME_SUCCESS(ctx.err());
  EXPECT_FALSE(ctx.deadline().has_value());
  EXPECT_TRUE(ctx.waitFor(1ms));
}

/**
 * @given a context with a derived child
 * @when the parent is cancelled
 * @then the child and its copies are cancelled too
 */
TEST(ContextTest, CancelPropagatesToChildren) {
  auto parent = Context::background().withCancel();
  auto child = parent.withTimeout(1h);
  auto copy = child;
  parent.cancel();
  EXPECT_OUTCOME_ERROR(child.err(), ContextError::CANCELED);
  EXPECT_OUTCOME_ERROR(copy.err(), ContextError::CANCELED);
  EXPECT_FALSE(copy.waitFor(1h));
}

/**
 * @given a cancelled child
 * @then its parent is still alive
 */
TEST(ContextTest, CancelDoesNotReachParent) {
  auto parent = Context::background().withCancel();
  auto child = parent.withCancel();
  child.cancel();
  EXPECT_TRUE(child.done());
  EXPECT_FALSE(parent.done());
}

/**
 * @given a context with a short timeout derived from one with a long timeout
 * @when the short timeout expires
 * @then the context reports the exceeded deadline
 */
TEST(ContextTest, DeadlineExceeded) {
  auto outer = Context::background().withTimeout(1h);
  auto inner = outer.withTimeout(1ms);
  ASSERT_TRUE(inner.deadline().has_value());
  EXPECT_LT(*inner.deadline(), *outer.deadline());
  EXPECT_FALSE(inner.waitFor(1h));
  EXPECT_OUTCOME_ERROR(inner.err(), ContextError::DEADLINE_EXCEEDED);
  EXPECT_OUTCOME_SUCCESS(outer.err());

  auto wider = inner.withTimeout(1h);
  EXPECT_EQ(wider.deadline(), inner.deadline());
}
