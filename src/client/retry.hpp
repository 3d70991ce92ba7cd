/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <random>

#include "client/context.hpp"

namespace shardkv::client {

  struct RetryOptions {
    std::chrono::nanoseconds initial_backoff = std::chrono::milliseconds{50};
    std::chrono::nanoseconds max_backoff = std::chrono::seconds{1};
    double multiplier = 2.0;
    // fraction of the backoff randomly added or subtracted
    double randomization_factor = 0.15;
    // 0 means unbounded
    size_t max_retries = 0;
  };

  RetryOptions defaultRetryOptions();

  /**
   * Exponential backoff loop:
   * @code
   * for (Retry r(ctx, options); r.next();) { ... }
   * @endcode
   * The first `next()` returns immediately. Later calls sleep for the
   * current backoff and return false once `max_retries` retries were made
   * or the context is done.
   */
  class Retry {
   public:
    Retry(Context ctx, RetryOptions options);

    bool next();

    /// Restarts the backoff sequence
    void reset();

    [[nodiscard]] size_t currentAttempt() const {
      return current_attempt_;
    }

    /// Backoff to be used before the next attempt
    [[nodiscard]] std::chrono::nanoseconds retryIn();

   private:
    Context ctx_;
    RetryOptions options_;
    size_t current_attempt_ = 0;
    bool is_reset_ = true;
    std::mt19937_64 random_;
  };

}  // namespace shardkv::client
