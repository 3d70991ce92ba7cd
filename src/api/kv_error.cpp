/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/kv_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(shardkv::api, KvError, e) {
  using E = shardkv::api::KvError;
  switch (e) {
    case E::CONDITION_FAILED:
      return "Unexpected value";
    case E::OP_REQUIRES_TXN:
      return "Operation requires a transaction";
    case E::RANGE_NOT_FOUND:
      return "Range not found";
    case E::RANGE_DESCRIPTOR_CHANGED:
      return "Range descriptor does not match expected value";
    case E::INVALID_LEASE_TARGET:
      return "Lease target is not a replica of the range";
    case E::VALUE_TYPE_MISMATCH:
      return "Existing value has a different type";
    case E::INVALID_ARGUMENT:
      return "Invalid request argument";
    case E::UNSUPPORTED_READ_CONSISTENCY:
      return "Method not allowed with requested read consistency";
    case E::TRANSACTION_RETRY:
      return "Transaction conflicts with a concurrent write";
    case E::TRANSACTION_RETRY_WITH_PROTO_REFRESH:
      return "Transaction restarted, retry the attempt";
    case E::TRANSACTION_ABORTED:
      return "Transaction aborted";
    case E::TRANSACTION_STATUS:
      return "Transaction is already finalized";
    case E::AMBIGUOUS_RESULT:
      return "Result is ambiguous";
    case E::UNHANDLED_RETRYABLE:
      return "Unhandled retryable error";
  }
  return "Unknown api::KvError";
}
