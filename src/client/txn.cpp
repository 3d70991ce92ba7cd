/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/txn.hpp"

#include <stdexcept>

#include "api/kv_error.hpp"
#include "client/db.hpp"
#include "client/retry.hpp"

namespace shardkv::client {

  namespace {
    constexpr std::chrono::seconds kAsyncRollbackTimeout{3};
  }

  Txn::Txn(DB &db, api::NodeId gateway, TxnType type)
      : db_(db),
        type_(type),
        sender_(db.factory().transactionalSender(type, gateway)),
        logger_(db.loggingSystem()->getLogger("Txn", log::clientGroupName)) {
    if (not sender_) {
      throw std::logic_error{"transaction sender factory returned nothing"};
    }
  }

  void Txn::setDebugName(std::string name) {
    debug_name_ = std::move(name);
    sender_->setDebugName(debug_name_);
  }

  api::TxnMeta Txn::meta() const {
    return sender_->meta();
  }

  uint32_t Txn::epoch() const {
    return sender_->epoch();
  }

  outcome::result<api::BatchResponse> Txn::send(const Context &ctx,
                                                api::BatchRequest ba) {
    auto res = db_.sendUsingSender(ctx, std::move(ba), *sender_);
    if (res.has_value() and res.value().header.txn
        and res.value().header.txn->status != api::TxnStatus::PENDING) {
      finalized_ = true;
    }
    return res;
  }

  outcome::result<void> Txn::run(const Context &ctx, Batch &b) {
    OUTCOME_TRY(b.prepare());
    return b.sendAndFill(
        [&](api::BatchRequest ba) { return send(ctx, std::move(ba)); });
  }

  outcome::result<void> Txn::commitInBatch(const Context &ctx, Batch &b) {
    if (type_ != TxnType::ROOT) {
      SL_CRITICAL(logger_, "leaf transaction \"{}\" can't commit", debug_name_);
      throw std::logic_error{"commitInBatch() called on leaf txn"};
    }
    b.appendEndTransaction(true);
    return run(ctx, b);
  }

  outcome::result<void> Txn::commit(const Context &ctx) {
    if (type_ != TxnType::ROOT) {
      SL_CRITICAL(logger_, "leaf transaction \"{}\" can't commit", debug_name_);
      throw std::logic_error{"commit() called on leaf txn"};
    }
    auto b = newBatch();
    b.addRawRequest(api::EndTransactionRequest{.commit = true});
    return getOneErr(run(ctx, b), b);
  }

  outcome::result<void> Txn::rollback(const Context &ctx) {
    SL_DEBUG(logger_, "rolling back transaction \"{}\"", debug_name_);
    if (not ctx.done()) {
      auto b = newBatch();
      b.addRawRequest(api::EndTransactionRequest{.commit = false});
      auto res = getOneErr(run(ctx, b), b);
      if (res.has_value() or not ctx.done()) {
        return res;
      }
      // the context was cancelled during the rollback, retry it detached
    }

    auto &stopper = db_.context().stopper;
    if (not stopper) {
      return ctx.err();
    }
    return stopper->runAsyncTask(
        "async-rollback",
        [sender = sender_, logger = logger_](const Context &quiesce) {
          auto rollback_ctx = quiesce.withTimeout(kAsyncRollbackTimeout);
          api::BatchRequest ba;
          ba.requests.emplace_back(
              api::EndTransactionRequest{.commit = false});
          if (auto res = sender->send(rollback_ctx, std::move(ba));
              res.has_error()) {
            SL_DEBUG(logger, "async rollback failed: {}", res.error().message());
          }
        });
  }

  void Txn::cleanupOnError(const Context &ctx, const std::error_code &err) {
    if (not err) {
      throw std::logic_error{"cleanupOnError() called without an error"};
    }
    if (finalized_) {
      return;
    }
    if (auto res = rollback(ctx); res.has_error()) {
      SL_WARN(logger_,
              "failure aborting transaction \"{}\": {}; abort caused by: {}",
              debug_name_,
              res.error().message(),
              err.message());
    }
  }

  outcome::result<void> Txn::exec(const Context &ctx, const Closure &fn) {
    outcome::result<void> res = outcome::success();
    Retry retry(ctx, sender_->retryOptions());
    while (retry.next()) {
      OUTCOME_TRY(ctx.err());

      res = fn(ctx, *this);
      if (res.has_value() and not finalized_) {
        res = commit(ctx);
      }
      if (res.has_value()) {
        return res;
      }

      auto err = res.error();
      if (not sender_->isRetryableErrMeantForTxn(err)) {
        SL_DEBUG(logger_,
                 "transaction \"{}\" failed: {}",
                 debug_name_,
                 err.message());
        return res;
      }
      SL_DEBUG(logger_,
               "transaction \"{}\" restarted at epoch {} after attempt {}: {}",
               debug_name_,
               sender_->epoch(),
               retry.currentAttempt() + 1,
               err.message());
      sender_->prepareForRetry(ctx, err);
    }

    OUTCOME_TRY(ctx.err());
    SL_WARN(logger_,
            "transaction \"{}\" exhausted {} attempts",
            debug_name_,
            retry.currentAttempt() + 1);
    return res;
  }

}  // namespace shardkv::client
