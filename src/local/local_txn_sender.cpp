/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "local/local_txn_sender.hpp"

#include <algorithm>

#include <boost/uuid/random_generator.hpp>

#include "api/kv_error.hpp"

namespace shardkv::local {

  namespace {
    bool isRollbackOnly(const api::BatchRequest &ba) {
      return not ba.requests.empty()
         and std::ranges::all_of(ba.requests, [](const api::Request &r) {
               auto end = std::get_if<api::EndTransactionRequest>(&r);
               return end != nullptr and not end->commit;
             });
    }
  }  // namespace

  LocalTxnSender::LocalTxnSender(qtils::SharedRef<log::LoggingSystem> logsys,
                                 qtils::SharedRef<LocalStore> store,
                                 qtils::SharedRef<clock::HybridClock> clock,
                                 client::TxnType type,
                                 api::NodeId gateway,
                                 client::RetryOptions retry_options)
      : logger_(logsys->getLogger("LocalTxnSender", log::storeGroupName)),
        store_(std::move(store)),
        clock_(std::move(clock)),
        type_(type),
        gateway_(gateway),
        retry_options_(retry_options) {
    meta_.id = boost::uuids::random_generator()();
    meta_.timestamp = clock_->now();
    state_.read_seq = store_->currentSeq();
  }

  outcome::result<api::BatchResponse> LocalTxnSender::send(
      const client::Context &ctx, api::BatchRequest ba) {
    OUTCOME_TRY(ctx.err());
    std::lock_guard lock(mutex_);

    switch (meta_.status) {
      case api::TxnStatus::PENDING:
        break;
      case api::TxnStatus::COMMITTED:
        return api::KvError::TRANSACTION_STATUS;
      case api::TxnStatus::ABORTED:
        if (isRollbackOnly(ba)) {
          api::BatchResponse br;
          br.header.now = clock_->now();
          br.header.txn = meta_;
          for (size_t i = 0; i < ba.requests.size(); ++i) {
            br.responses.push_back(
                {.index = i, .response = api::EndTransactionResponse{}});
          }
          return br;
        }
        return api::KvError::TRANSACTION_ABORTED;
    }

    if (ba.header.read_consistency != api::ReadConsistency::CONSISTENT) {
      return api::KvError::UNSUPPORTED_READ_CONSISTENCY;
    }
    if (ba.hasAdmin()
        or (type_ == client::TxnType::LEAF and ba.hasEndTransaction())) {
      return api::KvError::INVALID_ARGUMENT;
    }

    ba.header.txn = meta_;
    if (ba.header.gateway_node_id == 0) {
      ba.header.gateway_node_id = gateway_;
    }
    if (ba.header.timestamp.isEmpty()) {
      ba.header.timestamp = meta_.timestamp;
    }

    auto res = store_->evaluate(ba, &state_);
    if (res.has_error()) {
      if (res.error() == api::KvError::TRANSACTION_RETRY) {
        SL_DEBUG(logger_, "conflict in transaction {}", meta_);
        restart();
        return api::KvError::TRANSACTION_RETRY_WITH_PROTO_REFRESH;
      }
      return res.error();
    }

    auto &br = res.value();
    clock_->update(br.header.now);
    for (auto &request : ba.requests) {
      if (auto end = std::get_if<api::EndTransactionRequest>(&request)) {
        meta_.status =
            end->commit ? api::TxnStatus::COMMITTED : api::TxnStatus::ABORTED;
        SL_TRACE(logger_, "transaction {} finished", meta_);
      }
    }
    br.header.txn = meta_;
    return res;
  }

  api::TxnMeta LocalTxnSender::meta() const {
    std::lock_guard lock(mutex_);
    return meta_;
  }

  void LocalTxnSender::setDebugName(std::string name) {
    std::lock_guard lock(mutex_);
    meta_.name = std::move(name);
  }

  uint32_t LocalTxnSender::epoch() const {
    std::lock_guard lock(mutex_);
    return meta_.epoch;
  }

  bool LocalTxnSender::isRetryableErrMeantForTxn(
      const std::error_code &err) const {
    std::lock_guard lock(mutex_);
    return err == api::KvError::TRANSACTION_RETRY_WITH_PROTO_REFRESH
       and retry_pending_;
  }

  void LocalTxnSender::prepareForRetry(const client::Context &,
                                       const std::error_code &err) {
    std::lock_guard lock(mutex_);
    if (err == api::KvError::TRANSACTION_RETRY_WITH_PROTO_REFRESH) {
      retry_pending_ = false;
    }
  }

  void LocalTxnSender::restart() {
    ++meta_.epoch;
    meta_.timestamp = clock_->now();
    state_ = TxnState{};
    state_.read_seq = store_->currentSeq();
    retry_pending_ = true;
  }

}  // namespace shardkv::local
