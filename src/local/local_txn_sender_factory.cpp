/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "local/local_txn_sender_factory.hpp"

#include "local/local_txn_sender.hpp"

namespace shardkv::local {

  LocalTxnSenderFactory::LocalTxnSenderFactory(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<LocalStore> store,
      qtils::SharedRef<clock::HybridClock> clock,
      client::RetryOptions txn_retry_options)
      : logsys_(std::move(logsys)),
        store_(std::move(store)),
        clock_(std::move(clock)),
        txn_retry_options_(txn_retry_options),
        sender_(std::make_shared<LocalSender>(logsys_, store_, clock_)) {}

  std::shared_ptr<client::TxnSender> LocalTxnSenderFactory::transactionalSender(
      client::TxnType type, api::NodeId gateway) {
    return std::make_shared<LocalTxnSender>(
        logsys_, store_, clock_, type, gateway, txn_retry_options_);
  }

}  // namespace shardkv::local
