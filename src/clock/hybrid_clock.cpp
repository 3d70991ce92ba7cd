/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/hybrid_clock.hpp"

namespace shardkv::clock {

  HybridClock::HybridClock(qtils::SharedRef<SystemClock> physical_clock,
                           std::chrono::nanoseconds max_offset)
      : physical_clock_(std::move(physical_clock)), max_offset_(max_offset) {}

  api::Timestamp HybridClock::physicalNow() const {
    return {.wall_time = physical_clock_->nowNsec().count(), .logical = 0};
  }

  api::Timestamp HybridClock::now() {
    auto physical = physicalNow();
    std::lock_guard lock(mutex_);
    if (last_.wall_time >= physical.wall_time) {
      last_ = last_.next();
    } else {
      last_ = physical;
    }
    return last_;
  }

  void HybridClock::update(const api::Timestamp &remote) {
    auto physical = physicalNow();
    std::lock_guard lock(mutex_);
    if (physical.wall_time > last_.wall_time
        and physical.wall_time > remote.wall_time) {
      last_ = physical;
      return;
    }
    if (remote > last_) {
      last_ = remote;
    }
  }

}  // namespace shardkv::clock
