/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "client/sender.hpp"
#include "local/local_sender.hpp"

namespace shardkv::local {

  class LocalTxnSenderFactory final : public client::TxnSenderFactory {
   public:
    LocalTxnSenderFactory(qtils::SharedRef<log::LoggingSystem> logsys,
                          qtils::SharedRef<LocalStore> store,
                          qtils::SharedRef<clock::HybridClock> clock,
                          client::RetryOptions txn_retry_options);

    std::shared_ptr<client::TxnSender> transactionalSender(
        client::TxnType type, api::NodeId gateway) override;

    std::shared_ptr<client::Sender> nonTransactionalSender() override {
      return sender_;
    }

   private:
    qtils::SharedRef<log::LoggingSystem> logsys_;
    qtils::SharedRef<LocalStore> store_;
    qtils::SharedRef<clock::HybridClock> clock_;
    client::RetryOptions txn_retry_options_;
    std::shared_ptr<LocalSender> sender_;
  };

}  // namespace shardkv::local
