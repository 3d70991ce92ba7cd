/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "api/timestamp.hpp"

namespace shardkv::api {

  /// Client-chosen relative priority of a transaction or request
  using UserPriority = double;

  constexpr UserPriority kUnspecifiedUserPriority = 0;
  constexpr UserPriority kMinUserPriority = 0.001;
  constexpr UserPriority kNormalUserPriority = 1;
  constexpr UserPriority kMaxUserPriority = 1000;

  enum class TxnStatus : uint8_t {
    PENDING,
    COMMITTED,
    ABORTED,
  };

  /**
   * Transaction identity as seen on the wire. `epoch` is incremented every
   * time the coordinator restarts the transaction.
   */
  struct TxnMeta {
    boost::uuids::uuid id{};
    std::string name;
    uint32_t epoch = 0;
    Timestamp timestamp;
    UserPriority priority = kNormalUserPriority;
    TxnStatus status = TxnStatus::PENDING;

    bool operator==(const TxnMeta &) const = default;
  };

}  // namespace shardkv::api

template <>
struct fmt::formatter<shardkv::api::TxnMeta> {
  constexpr auto parse(format_parse_context &ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const shardkv::api::TxnMeta &txn, FormatContext &ctx) const {
    auto id = boost::uuids::to_string(txn.id);
    return fmt::format_to(ctx.out(),
                          "\"{}\" id={} epoch={} ts={}",
                          txn.name,
                          id.substr(0, 8),
                          txn.epoch,
                          txn.timestamp);
  }
};
