/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/cross_range_txn_wrapper_sender.hpp"

#include <stdexcept>

#include <boost/assert.hpp>

#include "api/kv_error.hpp"
#include "client/client_error.hpp"
#include "client/db.hpp"
#include "client/txn.hpp"

namespace shardkv::client {

  CrossRangeTxnWrapperSender::CrossRangeTxnWrapperSender(
      qtils::SharedRef<log::LoggingSystem> logsys,
      DB &db,
      std::shared_ptr<Sender> wrapped)
      : logger_(logsys->getLogger("CrossRangeTxnWrapper",
                                  log::clientGroupName)),
        db_(db),
        wrapped_(std::move(wrapped)) {
    BOOST_ASSERT(wrapped_ != nullptr);
  }

  outcome::result<api::BatchResponse> CrossRangeTxnWrapperSender::send(
      const Context &ctx, api::BatchRequest ba) {
    if (ba.header.txn.has_value()) {
      SL_CRITICAL(logger_,
                  "transactional batch of {} requests reached the "
                  "non-transactional sender",
                  ba.requests.size());
      throw std::logic_error{
          "CrossRangeTxnWrapperSender can't handle transactional requests"};
    }

    auto res = wrapped_->send(ctx, ba);
    if (res.has_value() or res.error() != api::KvError::OP_REQUIRES_TXN) {
      return res;
    }

    SL_DEBUG(logger_,
             "batch of {} requests spans several ranges, running it in a "
             "transaction",
             ba.requests.size());

    std::optional<api::BatchResponse> br;
    OUTCOME_TRY(db_.txn(
        ctx, [&](const Context &txn_ctx, Txn &txn) -> outcome::result<void> {
          txn.setDebugName("auto-wrap");
          auto b = txn.newBatch();
          b.header = ba.header;
          for (auto &request : ba.requests) {
            b.addRawRequest(request);
          }
          auto commit_res = txn.commitInBatch(txn_ctx, b);
          br = b.rawResponse();
          return commit_res;
        }));
    if (not br) {
      return ClientError::MISSING_RESPONSE;
    }

    // The caller did not ask for a transaction and must not see one
    br->header.txn.reset();
    std::erase_if(br->responses, [&](const api::IndexedResponse &r) {
      return r.index >= ba.requests.size();
    });
    return std::move(*br);
  }

}  // namespace shardkv::client
