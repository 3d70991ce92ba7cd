/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>

#include <qtils/shared_ref.hpp>

#include "client/sender.hpp"
#include "clock/hybrid_clock.hpp"
#include "local/local_store.hpp"
#include "log/logger.hpp"

namespace shardkv::local {

  /**
   * Coordinator of one optimistic transaction over a LocalStore. Keeps the
   * buffered writes and the read set between batches. A conflict restarts
   * the transaction at a new epoch and is reported as
   * KvError::TRANSACTION_RETRY_WITH_PROTO_REFRESH.
   */
  class LocalTxnSender final : public client::TxnSender {
   public:
    LocalTxnSender(qtils::SharedRef<log::LoggingSystem> logsys,
                   qtils::SharedRef<LocalStore> store,
                   qtils::SharedRef<clock::HybridClock> clock,
                   client::TxnType type,
                   api::NodeId gateway,
                   client::RetryOptions retry_options);

    outcome::result<api::BatchResponse> send(const client::Context &ctx,
                                             api::BatchRequest ba) override;

    api::TxnMeta meta() const override;

    void setDebugName(std::string name) override;

    uint32_t epoch() const override;

    bool isRetryableErrMeantForTxn(const std::error_code &err) const override;

    void prepareForRetry(const client::Context &ctx,
                         const std::error_code &err) override;

    const client::RetryOptions &retryOptions() const override {
      return retry_options_;
    }

   private:
    void restart();

    log::Logger logger_;
    qtils::SharedRef<LocalStore> store_;
    qtils::SharedRef<clock::HybridClock> clock_;
    client::TxnType type_;
    api::NodeId gateway_;
    client::RetryOptions retry_options_;

    mutable std::mutex mutex_;
    api::TxnMeta meta_;
    TxnState state_;
    bool retry_pending_ = false;
  };

}  // namespace shardkv::local
