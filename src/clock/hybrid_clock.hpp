/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <mutex>

#include <qtils/shared_ref.hpp>

#include "api/timestamp.hpp"
#include "clock/clock.hpp"

namespace shardkv::clock {

  /**
   * Hybrid logical clock. Combines the wall time of a physical clock with a
   * logical counter, so that timestamps it issues never go backwards and
   * stay ahead of every timestamp it was updated with.
   */
  class HybridClock {
   public:
    HybridClock(qtils::SharedRef<SystemClock> physical_clock,
                std::chrono::nanoseconds max_offset);

    /// Issues a timestamp greater than any previously issued or observed
    api::Timestamp now();

    /// Current physical time without touching the logical state
    [[nodiscard]] api::Timestamp physicalNow() const;

    /// Ratchets the clock forward after observing a remote timestamp
    void update(const api::Timestamp &remote);

    [[nodiscard]] std::chrono::nanoseconds maxOffset() const {
      return max_offset_;
    }

   private:
    qtils::SharedRef<SystemClock> physical_clock_;
    std::chrono::nanoseconds max_offset_;

    std::mutex mutex_;
    api::Timestamp last_;
  };

}  // namespace shardkv::clock
