/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "client/batch.hpp"
#include "client/sender.hpp"
#include "log/logger.hpp"
#include "utils/ctor_limiters.hpp"

namespace shardkv::client {

  class DB;

  /**
   * Handle of one transaction. Batches run through it are stamped with the
   * transaction by its coordinator (a TxnSender) and see each other's
   * writes. Nothing becomes visible to others before commit.
   */
  class Txn : NonCopyable, NonMovable {
   public:
    using Closure = std::function<outcome::result<void>(const Context &,
                                                        Txn &)>;

    Txn(DB &db, api::NodeId gateway, TxnType type = TxnType::ROOT);

    void setDebugName(std::string name);

    [[nodiscard]] const std::string &debugName() const {
      return debug_name_;
    }

    [[nodiscard]] api::TxnMeta meta() const;

    [[nodiscard]] uint32_t epoch() const;

    [[nodiscard]] TxnType type() const {
      return type_;
    }

    /// Committed or rolled back
    [[nodiscard]] bool isFinalized() const {
      return finalized_;
    }

    [[nodiscard]] Batch newBatch() const {
      return Batch{};
    }

    outcome::result<void> run(const Context &ctx, Batch &b);

    template <api::KeyLike K>
    outcome::result<KeyValue> get(const Context &ctx, const K &key) {
      auto b = newBatch();
      b.get(key);
      return getOneRow(run(ctx, b), b);
    }

    template <api::KeyLike K, typename V>
    outcome::result<void> put(const Context &ctx, const K &key, const V &value) {
      auto b = newBatch();
      b.put(key, value);
      return getOneErr(run(ctx, b), b);
    }

    template <api::KeyLike K, typename V, typename E>
    outcome::result<void> cPut(const Context &ctx,
                               const K &key,
                               const V &value,
                               const E &exp_value) {
      auto b = newBatch();
      b.cPut(key, value, exp_value);
      return getOneErr(run(ctx, b), b);
    }

    template <api::KeyLike K>
    outcome::result<KeyValue> inc(const Context &ctx,
                                  const K &key,
                                  int64_t value) {
      auto b = newBatch();
      b.inc(key, value);
      return getOneRow(run(ctx, b), b);
    }

    template <api::KeyLike B, api::KeyLike E>
    outcome::result<Result> scan(const Context &ctx,
                                 const B &begin,
                                 const E &end,
                                 int64_t max_rows) {
      auto b = newBatch();
      b.header.max_span_request_keys = max_rows;
      b.scan(begin, end);
      return getOneResult(run(ctx, b), b);
    }

    template <api::KeyLike... K>
    outcome::result<void> del(const Context &ctx, const K &...keys) {
      auto b = newBatch();
      b.del(keys...);
      return getOneErr(run(ctx, b), b);
    }

    template <api::KeyLike B, api::KeyLike E>
    outcome::result<void> delRange(const Context &ctx,
                                   const B &begin,
                                   const E &end) {
      auto b = newBatch();
      b.delRange(begin, end, false);
      return getOneErr(run(ctx, b), b);
    }

    /// Adds the commit to `b` so that both are sent in one round trip
    outcome::result<void> commitInBatch(const Context &ctx, Batch &b);

    outcome::result<void> commit(const Context &ctx);

    /**
     * Aborts the transaction. If `ctx` is already done, the abort is sent
     * asynchronously through the stopper of the DB.
     */
    outcome::result<void> rollback(const Context &ctx);

    /// Rolls back after the failure `err`, logging a failed rollback
    void cleanupOnError(const Context &ctx, const std::error_code &err);

    /**
     * Runs `fn` and commits, repeating the attempt while the coordinator
     * reports a restart of this transaction and the retry budget allows.
     * Any other error ends the loop and is returned as is; the caller is
     * responsible for cleanupOnError.
     */
    outcome::result<void> exec(const Context &ctx, const Closure &fn);

    [[nodiscard]] TxnSender &sender() const {
      return *sender_;
    }

   private:
    outcome::result<api::BatchResponse> send(const Context &ctx,
                                             api::BatchRequest ba);

    DB &db_;
    TxnType type_;
    std::shared_ptr<TxnSender> sender_;
    log::Logger logger_;
    std::string debug_name_;
    bool finalized_ = false;
  };

}  // namespace shardkv::client
