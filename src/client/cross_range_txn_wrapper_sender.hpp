/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/shared_ref.hpp>

#include "client/sender.hpp"
#include "log/logger.hpp"

namespace shardkv::client {

  class DB;

  /**
   * Sender for non-transactional batches. When the wrapped sender refuses a
   * batch with KvError::OP_REQUIRES_TXN (it spans several ranges), the batch
   * is re-run inside a transaction which is committed together with it. The
   * caller gets a response without any trace of that transaction.
   */
  class CrossRangeTxnWrapperSender final : public Sender {
   public:
    CrossRangeTxnWrapperSender(qtils::SharedRef<log::LoggingSystem> logsys,
                               DB &db,
                               std::shared_ptr<Sender> wrapped);

    /// Throws std::logic_error for transactional batches
    outcome::result<api::BatchResponse> send(const Context &ctx,
                                             api::BatchRequest ba) override;

    [[nodiscard]] Sender &wrapped() const {
      return *wrapped_;
    }

   private:
    log::Logger logger_;
    DB &db_;
    std::shared_ptr<Sender> wrapped_;
  };

}  // namespace shardkv::client
