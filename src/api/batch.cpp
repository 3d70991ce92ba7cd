/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/batch.hpp"

#include <algorithm>

#include "api/kv_error.hpp"

namespace shardkv::api {

  bool BatchRequest::hasWrite() const {
    return std::ranges::any_of(requests, isWrite);
  }

  bool BatchRequest::hasAdmin() const {
    return std::ranges::any_of(requests, isAdmin);
  }

  bool BatchRequest::hasEndTransaction() const {
    return std::ranges::any_of(requests, isEndTransaction);
  }

  outcome::result<void> supportsBatch(ReadConsistency rc,
                                      const BatchRequest &ba) {
    if (rc == ReadConsistency::CONSISTENT) {
      return outcome::success();
    }
    if (ba.header.txn.has_value()) {
      return KvError::UNSUPPORTED_READ_CONSISTENCY;
    }
    for (auto &request : ba.requests) {
      if (std::holds_alternative<GetRequest>(request)
          or std::holds_alternative<ScanRequest>(request)
          or std::holds_alternative<ReverseScanRequest>(request)) {
        continue;
      }
      return KvError::UNSUPPORTED_READ_CONSISTENCY;
    }
    return outcome::success();
  }

}  // namespace shardkv::api
