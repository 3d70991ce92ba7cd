/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace shardkv::clock {

  /**
   * Wall clock feeding the physical component of hybrid timestamps.
   * Tests substitute it to control time.
   */
  class SystemClock {
   public:
    using Duration = std::chrono::system_clock::duration;
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~SystemClock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;

    /// Nanoseconds since Unix epoch
    [[nodiscard]] virtual std::chrono::nanoseconds nowNsec() const = 0;

    /// Milliseconds since Unix epoch
    [[nodiscard]] virtual std::chrono::milliseconds nowMsec() const = 0;
  };

}  // namespace shardkv::clock
