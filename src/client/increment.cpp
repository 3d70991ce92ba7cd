/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/increment.hpp"

#include "api/kv_error.hpp"

namespace shardkv::client {

  outcome::result<int64_t> incrementValRetryable(const Context &ctx,
                                                 DB &db,
                                                 const api::Key &key,
                                                 int64_t inc,
                                                 const RetryOptions &options) {
    outcome::result<KeyValue> res = KeyValue{};
    for (Retry retry(ctx, options); retry.next();) {
      res = db.inc(ctx, key, inc);
      if (res.has_value()) {
        break;
      }
      if (res.error() != api::KvError::AMBIGUOUS_RESULT
          and res.error() != api::KvError::UNHANDLED_RETRYABLE) {
        break;
      }
    }
    OUTCOME_TRY(kv, res);
    return kv.valueInt();
  }

}  // namespace shardkv::client
