/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/db.hpp"

#include "api/kv_error.hpp"
#include "client/client_error.hpp"
#include "client/txn.hpp"

namespace shardkv::client {

  DBContext defaultDBContext() {
    return DBContext{
        .user_priority = api::kNormalUserPriority,
        .node_id = std::make_shared<NodeIdContainer>(),
        .stopper = std::make_shared<Stopper>(),
    };
  }

  DB::DB(qtils::SharedRef<log::LoggingSystem> logsys,
         qtils::SharedRef<TxnSenderFactory> factory,
         qtils::SharedRef<clock::HybridClock> clock,
         DBContext ctx)
      : logsys_(std::move(logsys)),
        logger_(logsys_->getLogger("DB", log::clientGroupName)),
        factory_(std::move(factory)),
        clock_(std::move(clock)),
        ctx_(std::move(ctx)) {
    if (not ctx_.node_id) {
      ctx_.node_id = std::make_shared<NodeIdContainer>();
    }
    if (not ctx_.stopper) {
      ctx_.stopper = std::make_shared<Stopper>();
    }
    crs_ = std::make_unique<CrossRangeTxnWrapperSender>(
        logsys_, *this, factory_->nonTransactionalSender());
  }

  outcome::result<void> DB::adminMerge(const Context &ctx,
                                       const api::Key &key) {
    Batch b;
    b.adminMerge(key);
    return getOneErr(run(ctx, b), b);
  }

  outcome::result<void> DB::adminSplit(const Context &ctx,
                                       const api::Key &span_key,
                                       const api::Key &split_key) {
    Batch b;
    b.adminSplit(span_key, split_key);
    return getOneErr(run(ctx, b), b);
  }

  outcome::result<void> DB::adminTransferLease(const Context &ctx,
                                               const api::Key &key,
                                               api::StoreId target) {
    Batch b;
    b.adminTransferLease(key, target);
    return getOneErr(run(ctx, b), b);
  }

  outcome::result<api::RangeDescriptor> DB::adminChangeReplicas(
      const Context &ctx,
      const api::Key &key,
      api::ReplicaChangeType change_type,
      std::vector<api::ReplicationTarget> targets,
      api::RangeDescriptor exp_desc) {
    Batch b;
    b.adminChangeReplicas(
        key, change_type, std::move(targets), std::move(exp_desc));
    OUTCOME_TRY(getOneErr(run(ctx, b), b));
    auto &response = b.rawResponse();
    if (not response or response->responses.empty()) {
      return ClientError::MISSING_RESPONSE;
    }
    auto reply = std::get_if<api::AdminChangeReplicasResponse>(
        &response->responses.front().response);
    if (reply == nullptr) {
      return ClientError::UNEXPECTED_RESPONSE_TYPE;
    }
    return reply->desc;
  }

  outcome::result<void> DB::adminRelocateRange(
      const Context &ctx,
      const api::Key &key,
      std::vector<api::ReplicationTarget> targets) {
    Batch b;
    b.adminRelocateRange(key, std::move(targets));
    return getOneErr(run(ctx, b), b);
  }

  outcome::result<void> DB::run(const Context &ctx, Batch &b) {
    OUTCOME_TRY(b.prepare());
    return b.sendAndFill([&](api::BatchRequest ba) {
      return sendUsingSender(ctx, std::move(ba), *crs_);
    });
  }

  outcome::result<void> DB::txn(const Context &ctx,
                                const TxnClosure &retryable) {
    Txn txn(*this, ctx_.node_id->get(), TxnType::ROOT);
    txn.setDebugName("unnamed");
    auto res = txn.exec(ctx, retryable);
    if (res.has_value()) {
      return res;
    }
    txn.cleanupOnError(ctx, res.error());
    if (res.error() == api::KvError::TRANSACTION_RETRY_WITH_PROTO_REFRESH) {
      SL_DEBUG(logger_,
               "transaction \"{}\" gave up retrying: {}",
               txn.debugName(),
               res.error().message());
      return ClientError::TERMINATED_RETRYABLE_ERROR;
    }
    return res;
  }

  outcome::result<api::BatchResponse> DB::sendUsingSender(
      const Context &ctx, api::BatchRequest ba, Sender &sender) {
    if (ba.requests.empty()) {
      return api::BatchResponse{};
    }
    OUTCOME_TRY(ctx.err());
    OUTCOME_TRY(api::supportsBatch(ba.header.read_consistency, ba));
    if (ba.header.user_priority == api::kUnspecifiedUserPriority) {
      ba.header.user_priority = ctx_.user_priority;
    }
    if (ba.header.gateway_node_id == 0) {
      ba.header.gateway_node_id = ctx_.node_id->get();
    }

    auto res = sender.send(ctx, std::move(ba));
    if (res.has_error()) {
      SL_DEBUG(logger_, "failed batch: {}", res.error().message());
    }
    return res;
  }

}  // namespace shardkv::client
