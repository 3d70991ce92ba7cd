/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "api/key.hpp"
#include "api/range.hpp"
#include "api/value.hpp"

namespace shardkv::api {

  struct GetRequest {
    Key key;
  };

  struct PutRequest {
    Key key;
    Value value;
    // non-versioned value, not allowed inside transactions
    bool inline_value = false;
  };

  struct ConditionalPutRequest {
    Key key;
    Value value;
    // nullopt requires the key to be absent
    std::optional<Value> exp_value;
  };

  struct InitPutRequest {
    Key key;
    Value value;
    // treat a deleted key as a conflicting existing value
    bool fail_on_tombstones = false;
  };

  struct IncrementRequest {
    Key key;
    int64_t increment = 0;
  };

  struct DeleteRequest {
    Key key;
  };

  struct DeleteRangeRequest {
    Span span;
    bool return_keys = false;
  };

  struct ScanRequest {
    Span span;
  };

  struct ReverseScanRequest {
    Span span;
  };

  struct EndTransactionRequest {
    bool commit = false;
  };

  struct AdminSplitRequest {
    Key key;
    Key split_key;
  };

  struct AdminMergeRequest {
    Key key;
  };

  struct AdminTransferLeaseRequest {
    Key key;
    StoreId target = 0;
  };

  struct AdminChangeReplicasRequest {
    Key key;
    ReplicaChangeType change_type = ReplicaChangeType::ADD_REPLICA;
    std::vector<ReplicationTarget> targets;
    RangeDescriptor exp_desc;
  };

  struct AdminRelocateRangeRequest {
    Key key;
    std::vector<ReplicationTarget> targets;
  };

  using Request = std::variant<GetRequest,
                               PutRequest,
                               ConditionalPutRequest,
                               InitPutRequest,
                               IncrementRequest,
                               DeleteRequest,
                               DeleteRangeRequest,
                               ScanRequest,
                               ReverseScanRequest,
                               EndTransactionRequest,
                               AdminSplitRequest,
                               AdminMergeRequest,
                               AdminTransferLeaseRequest,
                               AdminChangeReplicasRequest,
                               AdminRelocateRangeRequest>;

  std::string_view methodName(const Request &request);

  /// Keys addressed by the request; nullopt for EndTransaction
  std::optional<Span> requestSpan(const Request &request);

  /// Mutates user data
  bool isWrite(const Request &request);

  /// Addresses a key interval rather than a single key
  bool isRange(const Request &request);

  /// Changes range metadata, never part of a transaction
  bool isAdmin(const Request &request);

  inline bool isEndTransaction(const Request &request) {
    return std::holds_alternative<EndTransactionRequest>(request);
  }

}  // namespace shardkv::api
