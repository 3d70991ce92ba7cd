/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "local/local_cluster.hpp"

#include "clock/impl/clock_impl.hpp"

namespace shardkv::local {

  LocalCluster::LocalCluster(qtils::SharedRef<log::LoggingSystem> logsys,
                             ClusterConfig config,
                             std::shared_ptr<clock::SystemClock> physical_clock)
      : config_(std::move(config)) {
    if (not physical_clock) {
      physical_clock = std::make_shared<clock::SystemClockImpl>();
    }
    clock_ = std::make_shared<clock::HybridClock>(std::move(physical_clock),
                                                  config_.max_offset);
    store_ = std::make_shared<LocalStore>(logsys, clock_, config_.store);
    factory_ = std::make_shared<LocalTxnSenderFactory>(
        logsys, store_, clock_, config_.txn_retry_options);
    stopper_ = std::make_shared<client::Stopper>();

    auto node_id = std::make_shared<client::NodeIdContainer>();
    node_id->set(config_.node_id);
    std::shared_ptr<client::TxnSenderFactory> factory = factory_;
    db_ = std::make_unique<client::DB>(logsys,
                                       std::move(factory),
                                       clock_,
                                       client::DBContext{
                                           .user_priority =
                                               config_.user_priority,
                                           .node_id = std::move(node_id),
                                           .stopper = stopper_,
                                       });
  }

  LocalCluster::~LocalCluster() {
    // pending asynchronous rollbacks still use the store
    stopper_->stop();
  }

}  // namespace shardkv::local
