/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <memory>

#include "utils/ctor_limiters.hpp"

namespace {
  struct Unique : shardkv::Singleton<Unique> {};
}  // namespace

/**
 * @given a live singleton instance
 * @when another one is created
 * @then creation throws until the first instance is gone
 */
TEST(SingletonTest, OneInstanceAtATime) {
  EXPECT_FALSE(Unique::exists());
  auto first = std::make_unique<Unique>();
  EXPECT_TRUE(Unique::exists());
  EXPECT_THROW(Unique{}, std::logic_error);
  first.reset();
  EXPECT_FALSE(Unique::exists());
  EXPECT_NO_THROW(Unique{});
}

TEST(SingletonTest, Restrictions) {
  static_assert(not std::is_copy_constructible_v<Unique>);
  static_assert(not std::is_move_constructible_v<Unique>);
  static_assert(std::is_copy_constructible_v<shardkv::NonMovable>);
  static_assert(std::is_move_constructible_v<shardkv::NonCopyable>);
}
