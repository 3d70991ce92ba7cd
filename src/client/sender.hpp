/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <system_error>

#include <qtils/outcome.hpp>

#include "api/batch.hpp"
#include "client/context.hpp"
#include "client/retry.hpp"

namespace shardkv::client {

  /**
   * Anything able to deliver a BatchRequest and return a BatchResponse.
   * Responses may come in any order; each one is tagged with the index of
   * the request it answers.
   */
  class Sender {
   public:
    virtual ~Sender() = default;

    virtual outcome::result<api::BatchResponse> send(const Context &ctx,
                                                     api::BatchRequest ba) = 0;
  };

  enum class TxnType : uint8_t {
    // owns the transaction and may commit it
    ROOT,
    // participates in a transaction owned by a root elsewhere
    LEAF,
  };

  /**
   * Sender bound to one transaction. Stamps the transaction into outgoing
   * batches, tracks its state and decides which errors restart it.
   */
  class TxnSender : public Sender {
   public:
    [[nodiscard]] virtual api::TxnMeta meta() const = 0;

    virtual void setDebugName(std::string name) = 0;

    /// Incremented on every restart of the transaction
    [[nodiscard]] virtual uint32_t epoch() const = 0;

    /**
     * @return true if `err` is a restart signal this coordinator produced
     * for the current attempt, i.e. the attempt may simply be re-run
     */
    [[nodiscard]] virtual bool isRetryableErrMeantForTxn(
        const std::error_code &err) const = 0;

    /// Acknowledges a restart signal before the next attempt begins
    virtual void prepareForRetry(const Context &ctx,
                                 const std::error_code &err) = 0;

    /// Bounds the number of attempts and the pause between them
    [[nodiscard]] virtual const RetryOptions &retryOptions() const = 0;
  };

  class TxnSenderFactory {
   public:
    virtual ~TxnSenderFactory() = default;

    virtual std::shared_ptr<TxnSender> transactionalSender(
        TxnType type, api::NodeId gateway) = 0;

    virtual std::shared_ptr<Sender> nonTransactionalSender() = 0;
  };

}  // namespace shardkv::client
