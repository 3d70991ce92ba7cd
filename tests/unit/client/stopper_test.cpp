/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include <qtils/test/outcome.hpp>

#include "client/client_error.hpp"
#include "client/stopper.hpp"

using namespace std::chrono_literals;
using shardkv::client::ClientError;
using shardkv::client::Context;
using shardkv::client::Stopper;

/**
 * @given a task waiting for its context
 * @when the stopper is stopped
 * @then the task observes the cancellation and is joined
 */
TEST(StopperTest, StopCancelsTasks) {
  Stopper stopper;
  std::atomic_bool observed = false;
  ASSERT_OUTCOME_SUCCESS(
      stopper.runAsyncTask("waiter", [&](const Context &ctx) {
        while (ctx.waitFor(1h)) {
        }
        observed = ctx.done();
      }));
  stopper.stop();
  EXPECT_TRUE(observed);
  EXPECT_EQ(stopper.runningTasks(), 0);
}

/**
 * @given a stopped stopper
 * @when a task is submitted
 * @then it is rejected and never runs
 */
TEST(StopperTest, RejectsAfterStop) {
  Stopper stopper;
  stopper.stop();
  bool ran = false;
  EXPECT_OUTCOME_ERROR(
      stopper.runAsyncTask("late", [&](const Context &) { ran = true; }),
      ClientError::STOPPER_STOPPED);
  EXPECT_FALSE(ran);
}

/**
 * @given several finished tasks
 * @when the stopper is destroyed
 * @then all of them have run
 */
TEST(StopperTest, RunsAllTasks) {
  std::atomic_int counter = 0;
  {
    Stopper stopper;
    for (auto i = 0; i < 4; ++i) {
      ASSERT_OUTCOME_SUCCESS(stopper.runAsyncTask(
          "task", [&](const Context &) { counter.fetch_add(1); }));
    }
  }
  EXPECT_EQ(counter, 4);
}

/**
 * @given a stopper which is never stopped
 * @when many short tasks run one after another
 * @then finished workers are joined and do not pile up
 */
TEST(StopperTest, FinishedWorkersAreReaped) {
  Stopper stopper;
  for (auto i = 0; i < 32; ++i) {
    ASSERT_OUTCOME_SUCCESS(
        stopper.runAsyncTask("short", [](const Context &) {}));
    while (stopper.runningTasks() != 0) {
      std::this_thread::sleep_for(1ms);
    }
    EXPECT_LE(stopper.workerCount(), 1);
  }
  stopper.stop();
  EXPECT_EQ(stopper.workerCount(), 0);
}
