/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>

#include "api/range.hpp"

namespace shardkv::client {

  /// Identity of the gateway node, known only after the node has joined
  class NodeIdContainer {
   public:
    [[nodiscard]] api::NodeId get() const {
      return node_id_.load(std::memory_order_acquire);
    }

    void set(api::NodeId node_id) {
      node_id_.store(node_id, std::memory_order_release);
    }

   private:
    std::atomic<api::NodeId> node_id_{0};
  };

}  // namespace shardkv::client
