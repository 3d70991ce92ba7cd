/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "api/kv_error.hpp"
#include "client/increment.hpp"
#include "mock/client/sender_mock.hpp"
#include "mock/client/txn_sender_factory_mock.hpp"
#include "mock/clock/manual_clock.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using shardkv::api::BatchRequest;
using shardkv::api::BatchResponse;
using shardkv::api::IncrementRequest;
using shardkv::api::IncrementResponse;
using shardkv::api::keyFromString;
using shardkv::api::KvError;
using shardkv::client::Context;
using shardkv::client::DB;
using shardkv::client::incrementValRetryable;
using shardkv::client::RetryOptions;
using shardkv::client::SenderMock;
using shardkv::client::TxnSenderFactoryMock;
using shardkv::clock::HybridClock;
using shardkv::clock::ManualClock;
using testing::_;
using testing::Invoke;
using testing::Return;

class IncrementTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    factory = std::make_shared<TxnSenderFactoryMock>();
    sender = std::make_shared<SenderMock>();
    EXPECT_CALL(*factory, nonTransactionalSender()).WillOnce(Return(sender));
    db = std::make_unique<DB>(
        logsys,
        factory,
        std::make_shared<HybridClock>(std::make_shared<ManualClock>(), 0ns));
    options.initial_backoff = 1ms;
    options.max_backoff = 2ms;
    options.max_retries = 5;
  }

  static outcome::result<BatchResponse> answer(const BatchRequest &ba,
                                               int64_t new_value) {
    EXPECT_EQ(ba.requests.size(), 1);
    EXPECT_TRUE(std::holds_alternative<IncrementRequest>(ba.requests[0]));
    BatchResponse br;
    br.responses.push_back(
        {.index = 0, .response = IncrementResponse{.new_value = new_value}});
    return br;
  }

  qtils::SharedRef<shardkv::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
  Context ctx = Context::background();
  RetryOptions options;
  std::shared_ptr<TxnSenderFactoryMock> factory;
  std::shared_ptr<SenderMock> sender;
  std::unique_ptr<DB> db;
};

/**
 * @given a store which answers the first increment ambiguously
 * @when the value is incremented
 * @then the increment is resent and the new value is returned
 */
TEST_F(IncrementTest, RetriesAmbiguousResult) {
  EXPECT_CALL(*sender, send(_, _))
      .WillOnce(Return(KvError::AMBIGUOUS_RESULT))
      .WillOnce(Invoke([](const Context &, BatchRequest ba) {
        return answer(ba, 7);
      }));
  ASSERT_OUTCOME_SUCCESS(
      value, incrementValRetryable(ctx, *db, keyFromString("n"), 7, options));
  EXPECT_EQ(value, 7);
}

/**
 * @given a store failing with a non retryable error
 * @when the value is incremented
 * @then the error is returned after a single attempt
 */
TEST_F(IncrementTest, NonRetryableError) {
  EXPECT_CALL(*sender, send(_, _)).WillOnce(Return(KvError::VALUE_TYPE_MISMATCH));
  EXPECT_OUTCOME_ERROR(
      incrementValRetryable(ctx, *db, keyFromString("n"), 1, options),
      KvError::VALUE_TYPE_MISMATCH);
}

/**
 * @given a store which never resolves the ambiguity
 * @when the retries are exhausted
 * @then the last error is returned
 */
TEST_F(IncrementTest, RetriesExhausted) {
  options.max_retries = 2;
  EXPECT_CALL(*sender, send(_, _))
      .Times(3)
      .WillRepeatedly(Return(KvError::UNHANDLED_RETRYABLE));
  EXPECT_OUTCOME_ERROR(
      incrementValRetryable(ctx, *db, keyFromString("n"), 1, options),
      KvError::UNHANDLED_RETRYABLE);
}
