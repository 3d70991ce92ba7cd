/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "local/local_sender.hpp"

#include "api/kv_error.hpp"

namespace shardkv::local {

  LocalSender::LocalSender(qtils::SharedRef<log::LoggingSystem> logsys,
                           qtils::SharedRef<LocalStore> store,
                           qtils::SharedRef<clock::HybridClock> clock)
      : logger_(logsys->getLogger("LocalSender", log::storeGroupName)),
        store_(std::move(store)),
        clock_(std::move(clock)) {}

  outcome::result<api::BatchResponse> LocalSender::send(
      const client::Context &ctx, api::BatchRequest ba) {
    OUTCOME_TRY(ctx.err());
    if (ba.header.txn) {
      SL_ERROR(logger_,
               "transactional batch {} sent outside of its coordinator",
               *ba.header.txn);
      return api::KvError::INVALID_ARGUMENT;
    }
    if (ba.header.timestamp.isEmpty()) {
      ba.header.timestamp = clock_->now();
    }
    SL_TRACE(logger_,
             "evaluating batch of {} requests at {}",
             ba.requests.size(),
             ba.header.timestamp);
    auto res = store_->evaluate(ba, nullptr);
    if (res.has_value()) {
      clock_->update(res.value().header.now);
    }
    return res;
  }

}  // namespace shardkv::local
