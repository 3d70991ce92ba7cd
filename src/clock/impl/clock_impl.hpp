/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace shardkv::clock {

  class SystemClockImpl final : public SystemClock {
   public:
    TimePoint now() const override;
    std::chrono::nanoseconds nowNsec() const override;
    std::chrono::milliseconds nowMsec() const override;
  };

}  // namespace shardkv::clock
