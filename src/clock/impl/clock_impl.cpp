/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/clock_impl.hpp"

namespace shardkv::clock {

  SystemClock::TimePoint SystemClockImpl::now() const {
    return std::chrono::system_clock::now();
  }

  std::chrono::nanoseconds SystemClockImpl::nowNsec() const {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        now().time_since_epoch());
  }

  std::chrono::milliseconds SystemClockImpl::nowMsec() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now().time_since_epoch());
  }

}  // namespace shardkv::clock
