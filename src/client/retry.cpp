/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/retry.hpp"

#include <algorithm>
#include <cmath>

namespace shardkv::client {

  RetryOptions defaultRetryOptions() {
    return RetryOptions{};
  }

  Retry::Retry(Context ctx, RetryOptions options)
      : ctx_(std::move(ctx)),
        options_(options),
        random_(std::random_device{}()) {}

  void Retry::reset() {
    current_attempt_ = 0;
    is_reset_ = true;
  }

  std::chrono::nanoseconds Retry::retryIn() {
    auto backoff = static_cast<double>(options_.initial_backoff.count())
                 * std::pow(options_.multiplier,
                            static_cast<double>(current_attempt_));
    backoff = std::min(backoff,
                       static_cast<double>(options_.max_backoff.count()));
    if (options_.randomization_factor > 0 and backoff > 0) {
      auto delta = options_.randomization_factor * backoff;
      std::uniform_real_distribution<double> jitter(backoff - delta,
                                                    backoff + delta);
      backoff = jitter(random_);
    }
    return std::chrono::nanoseconds{static_cast<int64_t>(backoff)};
  }

  bool Retry::next() {
    if (is_reset_) {
      is_reset_ = false;
      return true;
    }
    if (options_.max_retries > 0
        and current_attempt_ >= options_.max_retries) {
      return false;
    }
    if (not ctx_.waitFor(retryIn())) {
      return false;
    }
    ++current_attempt_;
    return true;
  }

}  // namespace shardkv::client
