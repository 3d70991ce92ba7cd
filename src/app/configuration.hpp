/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "api/range.hpp"
#include "api/txn_meta.hpp"
#include "client/retry.hpp"
#include "utils/ctor_limiters.hpp"

namespace shardkv::app {

  class Configuration : Singleton<Configuration> {
   public:
    struct ClusterConfig {
      size_t nodes = 3;
      size_t replication_factor = 3;
      // initial range boundaries
      std::vector<std::string> split_keys;
    };

    struct ClientConfig {
      api::UserPriority user_priority = api::kNormalUserPriority;
      client::RetryOptions txn_retry = client::defaultRetryOptions();
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &version() const;
    [[nodiscard]] virtual const std::string &name() const;
    [[nodiscard]] virtual api::NodeId nodeId() const;

    [[nodiscard]] virtual const ClusterConfig &cluster() const;

    [[nodiscard]] virtual const ClientConfig &client() const;

    /// Words of the commands to run, in order
    [[nodiscard]] virtual const std::vector<std::string> &commands() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;
    api::NodeId node_id_;

    ClusterConfig cluster_;
    ClientConfig client_;
    std::vector<std::string> commands_;
  };

}  // namespace shardkv::app
