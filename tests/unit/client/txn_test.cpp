/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <thread>

#include <qtils/test/outcome.hpp>

#include "api/kv_error.hpp"
#include "client/client_error.hpp"
#include "client/txn.hpp"
#include "local/local_cluster.hpp"
#include "mock/client/sender_mock.hpp"
#include "mock/client/txn_sender_factory_mock.hpp"
#include "mock/client/txn_sender_mock.hpp"
#include "mock/clock/manual_clock.hpp"
#include "testutil/dummy_error.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using shardkv::api::BatchRequest;
using shardkv::api::BatchResponse;
using shardkv::api::EndTransactionRequest;
using shardkv::api::keyFromString;
using shardkv::api::KvError;
using shardkv::client::ClientError;
using shardkv::client::Context;
using shardkv::client::ContextError;
using shardkv::client::DB;
using shardkv::client::RetryOptions;
using shardkv::client::SenderMock;
using shardkv::client::Txn;
using shardkv::client::TxnSenderFactoryMock;
using shardkv::client::TxnSenderMock;
using shardkv::client::TxnType;
using shardkv::clock::HybridClock;
using shardkv::clock::ManualClock;
using shardkv::local::ClusterConfig;
using shardkv::local::LocalCluster;
using testing::_;
using testing::NiceMock;
using testing::Return;
using testing::ReturnRef;
using testutil::DummyError;

class TxnTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    ClusterConfig config;
    config.store.split_keys = {keyFromString("m")};
    config.txn_retry_options.initial_backoff = 1ms;
    config.txn_retry_options.max_backoff = 5ms;
    config.txn_retry_options.max_retries = 5;
    cluster = std::make_unique<LocalCluster>(logsys, config);
  }

  DB &db() {
    return cluster->db();
  }

  qtils::SharedRef<shardkv::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
  Context ctx = Context::background();
  std::unique_ptr<LocalCluster> cluster;
};

/**
 * @given a closure writing two keys in different ranges
 * @when it runs in a transaction
 * @then it is called once and both writes are committed
 */
TEST_F(TxnTest, CommitsOnSuccess) {
  size_t calls = 0;
  ASSERT_OUTCOME_SUCCESS(
      db().txn(ctx, [&](const Context &txn_ctx, Txn &txn) -> outcome::result<void> {
        ++calls;
        OUTCOME_TRY(txn.put(txn_ctx, "a", 1));
        OUTCOME_TRY(txn.put(txn_ctx, "x", 2));
        return outcome::success();
      }));
  EXPECT_EQ(calls, 1);

  ASSERT_OUTCOME_SUCCESS(a, db().get(ctx, "a"));
  EXPECT_EQ(a.valueInt(), 1);
  ASSERT_OUTCOME_SUCCESS(x, db().get(ctx, "x"));
  EXPECT_EQ(x.valueInt(), 2);
}

/**
 * @given a transaction which wrote a key
 * @when the key is read inside and outside of the transaction
 * @then only the transaction sees the write before commit
 */
TEST_F(TxnTest, WritesAreIsolated) {
  ASSERT_OUTCOME_SUCCESS(
      db().txn(ctx, [&](const Context &txn_ctx, Txn &txn) -> outcome::result<void> {
        OUTCOME_TRY(txn.put(txn_ctx, "a", "mine"));
        OUTCOME_TRY(own, txn.get(txn_ctx, "a"));
        EXPECT_TRUE(own.exists());
        OUTCOME_TRY(others, db().get(ctx, "a"));
        EXPECT_FALSE(others.exists());
        OUTCOME_TRY(rows, txn.scan(txn_ctx, "a", "z", 0));
        EXPECT_EQ(rows.rows.size(), 1);
        return outcome::success();
      }));
  ASSERT_OUTCOME_SUCCESS(a, db().get(ctx, "a"));
  EXPECT_TRUE(a.exists());
}

/**
 * @given a closure that writes and then fails
 * @when it runs in a transaction
 * @then the error is returned and the write is rolled back
 */
TEST_F(TxnTest, ErrorRollsBack) {
  size_t calls = 0;
  EXPECT_OUTCOME_ERROR(
      db().txn(ctx,
               [&](const Context &txn_ctx, Txn &txn) -> outcome::result<void> {
                 ++calls;
                 OUTCOME_TRY(txn.put(txn_ctx, "a", 1));
                 return DummyError::ERROR;
               }),
      DummyError::ERROR);
  EXPECT_EQ(calls, 1);
  ASSERT_OUTCOME_SUCCESS(a, db().get(ctx, "a"));
  EXPECT_FALSE(a.exists());
}

/**
 * @given a transaction whose read is overwritten by a concurrent writer
 * @when it commits
 * @then it restarts at a new epoch and the second attempt commits
 */
TEST_F(TxnTest, ConflictRestarts) {
  ASSERT_OUTCOME_SUCCESS(db().put(ctx, "balance", 10));
  size_t calls = 0;
  std::vector<uint32_t> epochs;
  ASSERT_OUTCOME_SUCCESS(
      db().txn(ctx, [&](const Context &txn_ctx, Txn &txn) -> outcome::result<void> {
        ++calls;
        epochs.push_back(txn.epoch());
        OUTCOME_TRY(balance, txn.get(txn_ctx, "balance"));
        if (calls == 1) {
          OUTCOME_TRY(db().put(ctx, "balance", 100));
        }
        return txn.put(txn_ctx, "copy", balance.valueInt());
      }));
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(epochs, (std::vector<uint32_t>{0, 1}));

  ASSERT_OUTCOME_SUCCESS(copy, db().get(ctx, "copy"));
  EXPECT_EQ(copy.valueInt(), 100);
}

/**
 * @given a closure committing by itself in its last batch
 * @when it runs in a transaction
 * @then the transaction is not committed a second time
 */
TEST_F(TxnTest, CommitInBatch) {
  ASSERT_OUTCOME_SUCCESS(
      db().txn(ctx, [&](const Context &txn_ctx, Txn &txn) -> outcome::result<void> {
        auto b = txn.newBatch();
        b.put("a", 1);
        b.inc("n", 2);
        OUTCOME_TRY(txn.commitInBatch(txn_ctx, b));
        EXPECT_TRUE(txn.isFinalized());
        EXPECT_EQ(b.results[1].rows[0].valueInt(), 2);
        return outcome::success();
      }));
  ASSERT_OUTCOME_SUCCESS(n, db().get(ctx, "n"));
  EXPECT_EQ(n.valueInt(), 2);
}

/**
 * @given a closure which writes and then sees its caller cancelled
 * @when it returns the cancellation
 * @then the rollback runs in the background and the write stays invisible
 */
TEST_F(TxnTest, CancelledContextRollsBackAsync) {
  auto caller = ctx.withCancel();
  EXPECT_OUTCOME_ERROR(
      db().txn(caller,
               [&](const Context &txn_ctx, Txn &txn) -> outcome::result<void> {
                 OUTCOME_TRY(txn.put(txn_ctx, "a", 1));
                 caller.cancel();
                 return txn_ctx.err();
               }),
      ContextError::CANCELED);
  EXPECT_EQ(cluster->stopper().workerCount(), 1);

  while (cluster->stopper().runningTasks() != 0) {
    std::this_thread::sleep_for(1ms);
  }
  cluster->stopper().stop();
  EXPECT_EQ(cluster->stopper().runningTasks(), 0);
  ASSERT_OUTCOME_SUCCESS(a, db().get(ctx, "a"));
  EXPECT_FALSE(a.exists());
}

/**
 * @given a closure whose caller is cancelled right after commitInBatch
 * @when it returns the cancellation
 * @then no rollback is attempted and the commit stands
 */
TEST_F(TxnTest, CancelAfterCommitKeepsCommit) {
  auto caller = ctx.withCancel();
  EXPECT_OUTCOME_ERROR(
      db().txn(caller,
               [&](const Context &txn_ctx, Txn &txn) -> outcome::result<void> {
                 auto b = txn.newBatch();
                 b.put("a", 1);
                 OUTCOME_TRY(txn.commitInBatch(txn_ctx, b));
                 caller.cancel();
                 EXPECT_TRUE(txn.isFinalized());
                 return txn_ctx.err();
               }),
      ContextError::CANCELED);
  EXPECT_EQ(cluster->stopper().workerCount(), 0);

  ASSERT_OUTCOME_SUCCESS(a, db().get(ctx, "a"));
  EXPECT_EQ(a.valueInt(), 1);
}

/**
 * @given a leaf transaction
 * @when it is committed
 * @then the programming error is raised
 */
TEST_F(TxnTest, LeafCannotCommit) {
  Txn leaf(db(), 1, TxnType::LEAF);
  EXPECT_EQ(leaf.type(), TxnType::LEAF);
  EXPECT_OUTCOME_SUCCESS(leaf.put(ctx, "a", 1));
  EXPECT_THROW(std::ignore = leaf.commit(ctx), std::logic_error);
}

class TxnRetryTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    factory = std::make_shared<TxnSenderFactoryMock>();
    txn_sender = std::make_shared<NiceMock<TxnSenderMock>>();
    retry_options.initial_backoff = 1ms;
    retry_options.max_backoff = 1ms;
    retry_options.max_retries = 2;

    ON_CALL(*txn_sender, retryOptions()).WillByDefault(ReturnRef(retry_options));
    EXPECT_CALL(*factory, nonTransactionalSender())
        .WillOnce(Return(std::make_shared<SenderMock>()));
    EXPECT_CALL(*factory, transactionalSender(TxnType::ROOT, _))
        .WillOnce(Return(txn_sender));
    db = std::make_unique<DB>(
        logsys,
        factory,
        std::make_shared<HybridClock>(std::make_shared<ManualClock>(), 0ns));
  }

  qtils::SharedRef<shardkv::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
  Context ctx = Context::background();
  RetryOptions retry_options;
  std::shared_ptr<TxnSenderFactoryMock> factory;
  std::shared_ptr<NiceMock<TxnSenderMock>> txn_sender;
  std::unique_ptr<DB> db;
};

/**
 * @given a coordinator that asks for a restart on every commit
 * @when the retries are exhausted
 * @then the terminated retryable error is returned
 */
TEST_F(TxnRetryTest, RetriesExhausted) {
  EXPECT_CALL(*txn_sender, send(_, _))
      .WillRepeatedly(Return(KvError::TRANSACTION_RETRY_WITH_PROTO_REFRESH));
  EXPECT_CALL(*txn_sender, isRetryableErrMeantForTxn(_))
      .WillRepeatedly(Return(true));
  EXPECT_CALL(*txn_sender, prepareForRetry(_, _)).Times(3);

  size_t calls = 0;
  EXPECT_OUTCOME_ERROR(
      db->txn(ctx,
              [&](const Context &, Txn &) -> outcome::result<void> {
                ++calls;
                return outcome::success();
              }),
      ClientError::TERMINATED_RETRYABLE_ERROR);
  EXPECT_EQ(calls, 3);
}

/**
 * @given an error the coordinator does not recognize as a restart
 * @when the closure returns it
 * @then it is returned without retrying
 */
TEST_F(TxnRetryTest, NonRetryableError) {
  EXPECT_CALL(*txn_sender, isRetryableErrMeantForTxn(_))
      .WillRepeatedly(Return(false));
  EXPECT_CALL(*txn_sender, prepareForRetry(_, _)).Times(0);

  size_t calls = 0;
  EXPECT_OUTCOME_ERROR(
      db->txn(ctx,
              [&](const Context &, Txn &) -> outcome::result<void> {
                ++calls;
                return DummyError::ERROR_3;
              }),
      DummyError::ERROR_3);
  EXPECT_EQ(calls, 1);
}

/**
 * @given a closure returning the cancellation of its caller
 * @when the transaction is cleaned up
 * @then the rollback is sent from the stopper with a live context
 */
TEST_F(TxnRetryTest, CancelledContextRollsBackAsync) {
  EXPECT_CALL(*txn_sender, isRetryableErrMeantForTxn(_))
      .WillRepeatedly(Return(false));
  EXPECT_CALL(*txn_sender, send(_, _))
      .WillOnce([](const Context &rollback_ctx, BatchRequest ba)
                    -> outcome::result<BatchResponse> {
        EXPECT_FALSE(rollback_ctx.done());
        EXPECT_EQ(ba.requests.size(), 1);
        auto end = std::get_if<EndTransactionRequest>(&ba.requests.front());
        EXPECT_TRUE(end != nullptr and not end->commit);
        return BatchResponse{};
      });

  auto caller = ctx.withCancel();
  EXPECT_OUTCOME_ERROR(
      db->txn(caller,
              [&](const Context &txn_ctx, Txn &) -> outcome::result<void> {
                caller.cancel();
                return txn_ctx.err();
              }),
      ContextError::CANCELED);
  auto &stopper = *db->context().stopper;
  while (stopper.runningTasks() != 0) {
    std::this_thread::sleep_for(1ms);
  }
  stopper.stop();
}
