/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "client/sender.hpp"

namespace shardkv::client {

  class TxnSenderFactoryMock : public TxnSenderFactory {
   public:
    MOCK_METHOD(std::shared_ptr<TxnSender>,
                transactionalSender,
                (TxnType, api::NodeId),
                (override));

    MOCK_METHOD(std::shared_ptr<Sender>, nonTransactionalSender, (), (override));
  };

}  // namespace shardkv::client
