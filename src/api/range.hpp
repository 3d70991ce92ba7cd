/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

#include "api/key.hpp"

namespace shardkv::api {

  using NodeId = int32_t;
  using StoreId = int32_t;
  using RangeId = int64_t;
  using ReplicaId = int32_t;

  struct ReplicationTarget {
    NodeId node_id = 0;
    StoreId store_id = 0;

    bool operator==(const ReplicationTarget &) const = default;
  };

  struct ReplicaDescriptor {
    NodeId node_id = 0;
    StoreId store_id = 0;
    ReplicaId replica_id = 0;

    bool operator==(const ReplicaDescriptor &) const = default;
  };

  enum class ReplicaChangeType : uint8_t {
    ADD_REPLICA,
    REMOVE_REPLICA,
  };

  /// Describes one contiguous key interval [start_key, end_key) and where it
  /// is replicated
  struct RangeDescriptor {
    RangeId range_id = 0;
    Key start_key;
    Key end_key;
    std::vector<ReplicaDescriptor> replicas;
    ReplicaId next_replica_id = 1;
    int64_t generation = 0;

    bool operator==(const RangeDescriptor &other) const {
      return range_id == other.range_id
         and keyEqual(start_key, other.start_key)
         and keyEqual(end_key, other.end_key) and replicas == other.replicas
         and next_replica_id == other.next_replica_id
         and generation == other.generation;
    }

    [[nodiscard]] bool containsKey(const Key &key) const {
      return not keyLess(key, start_key) and keyLess(key, end_key);
    }

    [[nodiscard]] const ReplicaDescriptor *findReplica(StoreId store) const {
      for (auto &replica : replicas) {
        if (replica.store_id == store) {
          return &replica;
        }
      }
      return nullptr;
    }
  };

}  // namespace shardkv::api

template <>
struct fmt::formatter<shardkv::api::RangeDescriptor> {
  constexpr auto parse(format_parse_context &ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const shardkv::api::RangeDescriptor &desc,
              FormatContext &ctx) const {
    auto out = fmt::format_to(ctx.out(),
                              "r{}:[{}, {}) [",
                              desc.range_id,
                              shardkv::api::prettyKey(desc.start_key),
                              shardkv::api::prettyKey(desc.end_key));
    for (size_t i = 0; i < desc.replicas.size(); ++i) {
      auto &replica = desc.replicas[i];
      out = fmt::format_to(out,
                           "{}(n{},s{}):{}",
                           i == 0 ? "" : ", ",
                           replica.node_id,
                           replica.store_id,
                           replica.replica_id);
    }
    return fmt::format_to(out, "]");
  }
};
