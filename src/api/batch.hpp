/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include <qtils/outcome.hpp>

#include "api/request.hpp"
#include "api/response.hpp"
#include "api/timestamp.hpp"
#include "api/txn_meta.hpp"

namespace shardkv::api {

  enum class ReadConsistency : uint8_t {
    CONSISTENT,
    READ_UNCOMMITTED,
    INCONSISTENT,
  };

  struct Header {
    Timestamp timestamp;
    ReadConsistency read_consistency = ReadConsistency::CONSISTENT;
    UserPriority user_priority = kUnspecifiedUserPriority;
    // limit on keys returned by all range requests of the batch; 0 is none
    int64_t max_span_request_keys = 0;
    // set only by a transaction coordinator
    std::optional<TxnMeta> txn;
    NodeId gateway_node_id = 0;
  };

  struct BatchRequest {
    Header header;
    std::vector<Request> requests;

    [[nodiscard]] bool hasWrite() const;
    [[nodiscard]] bool hasAdmin() const;
    [[nodiscard]] bool hasEndTransaction() const;
  };

  struct BatchResponseHeader {
    Timestamp now;
    // final state of the transaction, when the batch was transactional
    std::optional<TxnMeta> txn;
  };

  /// Responses come in unspecified order, see IndexedResponse::index
  struct BatchResponse {
    BatchResponseHeader header;
    std::vector<IndexedResponse> responses;
  };

  /**
   * Checks that every request of the batch may be served with the read
   * consistency `rc`. Only Get, Scan and ReverseScan are allowed in
   * inconsistent batches, which also must not be transactional.
   */
  outcome::result<void> supportsBatch(ReadConsistency rc,
                                      const BatchRequest &ba);

}  // namespace shardkv::api
