/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace shardkv::client {

  enum class ClientError : uint8_t {
    // retryable error escaped the transaction retry loop
    TERMINATED_RETRYABLE_ERROR = 1,
    MISSING_RESPONSE,
    UNEXPECTED_RESPONSE_TYPE,
    BATCH_ALREADY_USED,
    // another call of the same batch failed to construct
    BATCH_NOT_SENT,
    MIXED_RAW_REQUESTS,
    STOPPER_STOPPED,
  };

}  // namespace shardkv::client

OUTCOME_HPP_DECLARE_ERROR(shardkv::client, ClientError);
