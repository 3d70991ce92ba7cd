/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/shared_ref.hpp>

#include "client/db.hpp"
#include "local/local_store.hpp"
#include "local/local_txn_sender_factory.hpp"
#include "utils/ctor_limiters.hpp"

namespace shardkv::local {

  struct ClusterConfig {
    StoreConfig store;
    client::RetryOptions txn_retry_options = client::defaultRetryOptions();
    std::chrono::nanoseconds max_offset = std::chrono::milliseconds{500};
    api::NodeId node_id = 1;
    api::UserPriority user_priority = api::kNormalUserPriority;
  };

  /**
   * In-process cluster: a LocalStore with the senders serving it and a DB
   * client on top. Used by the CLI and by tests.
   */
  class LocalCluster : NonCopyable, NonMovable {
   public:
    /// `physical_clock` defaults to the system clock
    LocalCluster(qtils::SharedRef<log::LoggingSystem> logsys,
                 ClusterConfig config,
                 std::shared_ptr<clock::SystemClock> physical_clock = nullptr);

    ~LocalCluster();

    [[nodiscard]] client::DB &db() const {
      return *db_;
    }

    [[nodiscard]] LocalStore &store() const {
      return *store_;
    }

    [[nodiscard]] clock::HybridClock &clock() const {
      return *clock_;
    }

    /// Runs asynchronous rollbacks of the DB
    [[nodiscard]] client::Stopper &stopper() const {
      return *stopper_;
    }

    [[nodiscard]] const ClusterConfig &config() const {
      return config_;
    }

   private:
    ClusterConfig config_;
    std::shared_ptr<clock::HybridClock> clock_;
    std::shared_ptr<LocalStore> store_;
    std::shared_ptr<LocalTxnSenderFactory> factory_;
    std::shared_ptr<client::Stopper> stopper_;
    std::unique_ptr<client::DB> db_;
  };

}  // namespace shardkv::local
