/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace shardkv::api {

  /// Structured errors returned by the store and transaction coordinators
  enum class KvError : uint8_t {
    CONDITION_FAILED = 1,
    OP_REQUIRES_TXN,
    RANGE_NOT_FOUND,
    RANGE_DESCRIPTOR_CHANGED,
    INVALID_LEASE_TARGET,
    VALUE_TYPE_MISMATCH,
    INVALID_ARGUMENT,
    UNSUPPORTED_READ_CONSISTENCY,
    // storage detected a serialization conflict for the current attempt
    TRANSACTION_RETRY,
    // coordinator restarted the transaction; the closure must run again
    TRANSACTION_RETRY_WITH_PROTO_REFRESH,
    TRANSACTION_ABORTED,
    // transaction already committed or rolled back
    TRANSACTION_STATUS,
    AMBIGUOUS_RESULT,
    UNHANDLED_RETRYABLE,
  };

}  // namespace shardkv::api

OUTCOME_HPP_DECLARE_ERROR(shardkv::api, KvError);
