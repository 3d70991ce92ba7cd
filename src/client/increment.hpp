/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "client/db.hpp"
#include "client/retry.hpp"

namespace shardkv::client {

  /**
   * Increments the integer at `key`, retrying with backoff while the store
   * reports an ambiguous result or an unhandled retryable error.
   * @return the new value
   */
  outcome::result<int64_t> incrementValRetryable(
      const Context &ctx,
      DB &db,
      const api::Key &key,
      int64_t inc,
      const RetryOptions &options = defaultRetryOptions());

}  // namespace shardkv::client
