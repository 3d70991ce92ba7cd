/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "client/sender.hpp"
#include "clock/hybrid_clock.hpp"
#include "local/local_store.hpp"
#include "log/logger.hpp"

namespace shardkv::local {

  /// Non-transactional sender evaluating batches against a LocalStore
  class LocalSender final : public client::Sender {
   public:
    LocalSender(qtils::SharedRef<log::LoggingSystem> logsys,
                qtils::SharedRef<LocalStore> store,
                qtils::SharedRef<clock::HybridClock> clock);

    outcome::result<api::BatchResponse> send(const client::Context &ctx,
                                             api::BatchRequest ba) override;

   private:
    log::Logger logger_;
    qtils::SharedRef<LocalStore> store_;
    qtils::SharedRef<clock::HybridClock> clock_;
  };

}  // namespace shardkv::local
