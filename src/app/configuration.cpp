/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace shardkv::app {

  Configuration::Configuration()
      : version_("undefined"),
        name_("unnamed"),
        node_id_(1),
        cluster_{
            .nodes = 3,
            .replication_factor = 3,
            .split_keys = {},
        },
        client_{
            .user_priority = api::kNormalUserPriority,
            .txn_retry = client::defaultRetryOptions(),
        } {}

  const std::string &Configuration::version() const {
    return version_;
  }

  const std::string &Configuration::name() const {
    return name_;
  }

  api::NodeId Configuration::nodeId() const {
    return node_id_;
  }

  const Configuration::ClusterConfig &Configuration::cluster() const {
    return cluster_;
  }

  const Configuration::ClientConfig &Configuration::client() const {
    return client_;
  }

  const std::vector<std::string> &Configuration::commands() const {
    return commands_;
  }

}  // namespace shardkv::app
