/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>

#include "clock/clock.hpp"

namespace shardkv::clock {

  /**
   * SystemClock whose time moves only when a test says so
   */
  class ManualClock : public SystemClock {
   public:
    ManualClock() = default;

    explicit ManualClock(std::chrono::nanoseconds initial_time)
        : current_time_(initial_time.count()) {}

    TimePoint now() const override {
      return TimePoint(std::chrono::duration_cast<Duration>(nowNsec()));
    }

    std::chrono::nanoseconds nowNsec() const override {
      return std::chrono::nanoseconds(current_time_.load());
    }

    std::chrono::milliseconds nowMsec() const override {
      return std::chrono::duration_cast<std::chrono::milliseconds>(nowNsec());
    }

    void advance(std::chrono::nanoseconds delta) {
      current_time_ += delta.count();
    }

    void setTime(std::chrono::nanoseconds time) {
      current_time_ = time.count();
    }

   private:
    std::atomic<int64_t> current_time_{0};
  };

}  // namespace shardkv::clock
