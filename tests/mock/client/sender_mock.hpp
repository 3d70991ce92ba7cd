/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "client/sender.hpp"

namespace shardkv::client {

  class SenderMock : public Sender {
   public:
    MOCK_METHOD(outcome::result<api::BatchResponse>,
                send,
                (const Context &, api::BatchRequest),
                (override));
  };

}  // namespace shardkv::client
