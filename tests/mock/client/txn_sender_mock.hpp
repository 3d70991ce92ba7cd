/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "client/sender.hpp"

namespace shardkv::client {

  class TxnSenderMock : public TxnSender {
   public:
    MOCK_METHOD(outcome::result<api::BatchResponse>,
                send,
                (const Context &, api::BatchRequest),
                (override));

    MOCK_METHOD(api::TxnMeta, meta, (), (const, override));

    MOCK_METHOD(void, setDebugName, (std::string), (override));

    MOCK_METHOD(uint32_t, epoch, (), (const, override));

    MOCK_METHOD(bool,
                isRetryableErrMeantForTxn,
                (const std::error_code &),
                (const, override));

    MOCK_METHOD(void,
                prepareForRetry,
                (const Context &, const std::error_code &),
                (override));

    MOCK_METHOD(const RetryOptions &, retryOptions, (), (const, override));
  };

}  // namespace shardkv::client
