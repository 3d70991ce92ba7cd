/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace shardkv::client {

  enum class ContextError : uint8_t {
    CANCELED = 1,
    DEADLINE_EXCEEDED,
  };

  /**
   * Carries cancellation and deadline of a caller through batches and
   * transactions. Copies share state; derived contexts are cancelled
   * together with their parent.
   */
  class Context {
   public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    /// Context that is never cancelled and has no deadline
    static Context background();

    Context withCancel() const;
    Context withDeadline(TimePoint deadline) const;
    Context withTimeout(Clock::duration timeout) const;

    void cancel() const;

    /// CANCELED or DEADLINE_EXCEEDED once the context is done
    outcome::result<void> err() const;

    [[nodiscard]] bool done() const {
      return err().has_error();
    }

    [[nodiscard]] std::optional<TimePoint> deadline() const;

    /**
     * Blocks for `duration` or until the context is done
     * @return false if the context is done
     */
    bool waitFor(Clock::duration duration) const;

   private:
    struct State {
      std::mutex mutex;
      std::condition_variable cv;
      bool cancelled = false;
      std::optional<TimePoint> deadline;
      std::vector<std::weak_ptr<State>> children;
    };

    explicit Context(std::shared_ptr<State> state);

    Context derive(std::optional<TimePoint> deadline) const;
    static void cancelState(const std::shared_ptr<State> &state);

    std::shared_ptr<State> state_;
  };

}  // namespace shardkv::client

OUTCOME_HPP_DECLARE_ERROR(shardkv::client, ContextError);
