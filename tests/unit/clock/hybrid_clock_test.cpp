/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "clock/hybrid_clock.hpp"
#include "mock/clock/manual_clock.hpp"

using namespace std::chrono_literals;
using shardkv::api::Timestamp;
using shardkv::clock::HybridClock;
using shardkv::clock::ManualClock;

class HybridClockTest : public testing::Test {
 public:
  std::shared_ptr<ManualClock> physical = std::make_shared<ManualClock>(100ns);
  HybridClock clock{physical, 500ms};
};

/**
 * @given a physical clock that does not move
 * @when timestamps are issued
 * @then the logical component keeps them increasing
 */
TEST_F(HybridClockTest, MonotonicWithoutPhysicalProgress) {
  EXPECT_EQ(clock.now(), (Timestamp{.wall_time = 100, .logical = 0}));
  EXPECT_EQ(clock.now(), (Timestamp{.wall_time = 100, .logical = 1}));
  EXPECT_EQ(clock.now(), (Timestamp{.wall_time = 100, .logical = 2}));

  physical->advance(10ns);
  EXPECT_EQ(clock.now(), (Timestamp{.wall_time = 110, .logical = 0}));
  EXPECT_EQ(clock.physicalNow(), (Timestamp{.wall_time = 110, .logical = 0}));
  EXPECT_EQ(clock.maxOffset(), 500ms);
}

/**
 * @given a remote timestamp ahead of the local physical time
 * @when the clock is updated with it
 * @then later timestamps are issued after the remote one
 */
TEST_F(HybridClockTest, UpdateFromRemote) {
  Timestamp remote{.wall_time = 1000, .logical = 5};
  clock.update(remote);
  EXPECT_EQ(clock.now(), remote.next());

  // stale remote timestamps are ignored
  clock.update({.wall_time = 50, .logical = 0});
  EXPECT_GT(clock.now(), remote.next());

  physical->setTime(2000ns);
  clock.update(remote);
  EXPECT_EQ(clock.now(), (Timestamp{.wall_time = 2000, .logical = 1}));
}
