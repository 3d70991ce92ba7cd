/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>

#include <qtils/shared_ref.hpp>

#include "client/batch.hpp"
#include "client/cross_range_txn_wrapper_sender.hpp"
#include "client/node_id_container.hpp"
#include "client/sender.hpp"
#include "client/stopper.hpp"
#include "clock/hybrid_clock.hpp"
#include "log/logger.hpp"
#include "utils/ctor_limiters.hpp"

namespace shardkv::client {

  class Txn;

  /// Immutable configuration of a DB
  struct DBContext {
    // attached to batches which specify no priority
    api::UserPriority user_priority = api::kNormalUserPriority;
    std::shared_ptr<NodeIdContainer> node_id;
    // runs asynchronous rollbacks
    std::shared_ptr<Stopper> stopper;
  };

  DBContext defaultDBContext();

  /**
   * Entry point of the client. Runs batches outside of transactions, with
   * automatic promotion to a transaction when a batch spans several ranges,
   * and runs closures inside retried transactions.
   *
   * Convenience operations build a batch with a single call and unwrap its
   * Result.
   */
  class DB : NonCopyable, NonMovable {
   public:
    using TxnClosure = std::function<outcome::result<void>(const Context &,
                                                           Txn &)>;

    DB(qtils::SharedRef<log::LoggingSystem> logsys,
       qtils::SharedRef<TxnSenderFactory> factory,
       qtils::SharedRef<clock::HybridClock> clock,
       DBContext ctx = defaultDBContext());

    template <api::KeyLike K>
    outcome::result<KeyValue> get(const Context &ctx, const K &key) {
      Batch b;
      b.get(key);
      return getOneRow(run(ctx, b), b);
    }

    /// Reads and decodes a value; absent key gives a default constructed T
    template <typename T, api::KeyLike K>
      requires api::DecodableValue<T>
    outcome::result<T> getValue(const Context &ctx, const K &key) {
      OUTCOME_TRY(kv, get(ctx, key));
      return kv.template valueAs<T>();
    }

    template <api::KeyLike K, typename V>
    outcome::result<void> put(const Context &ctx, const K &key, const V &value) {
      Batch b;
      b.put(key, value);
      return getOneErr(run(ctx, b), b);
    }

    template <api::KeyLike K, typename V>
    outcome::result<void> putInline(const Context &ctx,
                                    const K &key,
                                    const V &value) {
      Batch b;
      b.putInline(key, value);
      return getOneErr(run(ctx, b), b);
    }

    /// Fails with KvError::CONDITION_FAILED if the stored value differs
    template <api::KeyLike K, typename V, typename E>
    outcome::result<void> cPut(const Context &ctx,
                               const K &key,
                               const V &value,
                               const E &exp_value) {
      Batch b;
      b.cPut(key, value, exp_value);
      return getOneErr(run(ctx, b), b);
    }

    template <api::KeyLike K, typename V>
    outcome::result<void> initPut(const Context &ctx,
                                  const K &key,
                                  const V &value,
                                  bool fail_on_tombstones) {
      Batch b;
      b.initPut(key, value, fail_on_tombstones);
      return getOneErr(run(ctx, b), b);
    }

    /// @return the row with the new value
    template <api::KeyLike K>
    outcome::result<KeyValue> inc(const Context &ctx,
                                  const K &key,
                                  int64_t value) {
      Batch b;
      b.inc(key, value);
      return getOneRow(run(ctx, b), b);
    }

    /**
     * At most `max_rows` rows of [begin, end), 0 for no limit. The resume
     * span of the Result tells where to continue.
     */
    template <api::KeyLike B, api::KeyLike E>
    outcome::result<Result> scan(const Context &ctx,
                                 const B &begin,
                                 const E &end,
                                 int64_t max_rows) {
      Batch b;
      b.header.max_span_request_keys = max_rows;
      b.header.read_consistency = api::ReadConsistency::CONSISTENT;
      b.scan(begin, end);
      return getOneResult(run(ctx, b), b);
    }

    template <api::KeyLike B, api::KeyLike E>
    outcome::result<Result> reverseScan(const Context &ctx,
                                        const B &begin,
                                        const E &end,
                                        int64_t max_rows) {
      Batch b;
      b.header.max_span_request_keys = max_rows;
      b.header.read_consistency = api::ReadConsistency::CONSISTENT;
      b.reverseScan(begin, end);
      return getOneResult(run(ctx, b), b);
    }

    template <api::KeyLike... K>
    outcome::result<void> del(const Context &ctx, const K &...keys) {
      Batch b;
      b.del(keys...);
      return getOneErr(run(ctx, b), b);
    }

    /// @return deleted keys
    template <api::KeyLike B, api::KeyLike E>
    outcome::result<std::vector<api::Key>> delRange(const Context &ctx,
                                                    const B &begin,
                                                    const E &end) {
      Batch b;
      b.delRange(begin, end, true);
      OUTCOME_TRY(result, getOneResult(run(ctx, b), b));
      return std::move(result.keys);
    }

    /// Merges the range containing `key` with the range following it
    outcome::result<void> adminMerge(const Context &ctx, const api::Key &key);

    /// Splits the range containing `span_key` at `split_key`
    outcome::result<void> adminSplit(const Context &ctx,
                                     const api::Key &span_key,
                                     const api::Key &split_key);

    outcome::result<void> adminTransferLease(const Context &ctx,
                                             const api::Key &key,
                                             api::StoreId target);

    /// @return descriptor of the range after the change
    outcome::result<api::RangeDescriptor> adminChangeReplicas(
        const Context &ctx,
        const api::Key &key,
        api::ReplicaChangeType change_type,
        std::vector<api::ReplicationTarget> targets,
        api::RangeDescriptor exp_desc);

    outcome::result<void> adminRelocateRange(
        const Context &ctx,
        const api::Key &key,
        std::vector<api::ReplicationTarget> targets);

    /// Runs a batch outside of any transaction
    outcome::result<void> run(const Context &ctx, Batch &b);

    /**
     * Runs `retryable` in a new transaction and commits it, unless the
     * closure already did. The closure is re-run on retryable conflicts, so
     * it must not have side effects outside the transaction. A retryable
     * error escaping the retry loop turns into
     * ClientError::TERMINATED_RETRYABLE_ERROR.
     */
    outcome::result<void> txn(const Context &ctx, const TxnClosure &retryable);

    /**
     * Common send path: checks context and read consistency, attaches
     * default priority and gateway node, and sends through `sender`
     */
    outcome::result<api::BatchResponse> sendUsingSender(const Context &ctx,
                                                        api::BatchRequest ba,
                                                        Sender &sender);

    [[nodiscard]] Sender &nonTransactionalSender() const {
      return *crs_;
    }

    [[nodiscard]] TxnSenderFactory &factory() const {
      return *factory_;
    }

    [[nodiscard]] clock::HybridClock &clock() const {
      return *clock_;
    }

    [[nodiscard]] const DBContext &context() const {
      return ctx_;
    }

    [[nodiscard]] const qtils::SharedRef<log::LoggingSystem> &loggingSystem()
        const {
      return logsys_;
    }

   private:
    qtils::SharedRef<log::LoggingSystem> logsys_;
    log::Logger logger_;
    qtils::SharedRef<TxnSenderFactory> factory_;
    qtils::SharedRef<clock::HybridClock> clock_;
    DBContext ctx_;
    std::unique_ptr<CrossRangeTxnWrapperSender> crs_;
  };

}  // namespace shardkv::client
