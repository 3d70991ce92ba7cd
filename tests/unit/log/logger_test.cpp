/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "log/logger.hpp"
#include "testutil/prepare_loggers.hpp"

using shardkv::log::Error;
using shardkv::log::Level;
using shardkv::log::str2lvl;

TEST(LoggerTest, LevelNames) {
  ASSERT_OUTCOME_SUCCESS(trace, str2lvl("trace"));
  EXPECT_EQ(trace, Level::TRACE);
  ASSERT_OUTCOME_SUCCESS(warn, str2lvl("warning"));
  EXPECT_EQ(warn, Level::WARN);
  ASSERT_OUTCOME_SUCCESS(off, str2lvl("no"));
  EXPECT_EQ(off, Level::OFF);
  EXPECT_OUTCOME_ERROR(str2lvl("loud"), Error::WRONG_LEVEL);
}

/**
 * @given the configured logging system
 * @when filters are applied
 * @then well-formed filters succeed and malformed ones are reported
 */
TEST(LoggerTest, TuneLoggingSystem) {
  auto logsys = testutil::prepareLoggers();
  EXPECT_OUTCOME_SUCCESS(
      logsys->tuneLoggingSystem({"warn", "kv_client=debug"}));
  EXPECT_OUTCOME_ERROR(logsys->tuneLoggingSystem({"nope=debug"}),
                       Error::WRONG_GROUP);
  EXPECT_OUTCOME_ERROR(logsys->tuneLoggingSystem({"kv_client=loud"}),
                       Error::WRONG_LEVEL);
  EXPECT_OUTCOME_ERROR(logsys->tuneLoggingSystem({"=debug"}),
                       Error::WRONG_FILTER);
  EXPECT_OUTCOME_ERROR(logsys->tuneLoggingSystem({"kv_client="}),
                       Error::WRONG_FILTER);
  EXPECT_OUTCOME_SUCCESS(
      logsys->tuneLoggingSystem({"info", "kv_client=info"}));
}
