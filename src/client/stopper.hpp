/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <qtils/outcome.hpp>

#include "client/context.hpp"
#include "utils/ctor_limiters.hpp"

namespace shardkv::client {

  /**
   * Supervisor of asynchronous background tasks. Every task runs on its own
   * named thread and gets a context which is cancelled when the stopper
   * starts quiescing.
   */
  class Stopper : NonCopyable, NonMovable {
   public:
    using Task = std::function<void(const Context &)>;

    Stopper();
    ~Stopper();

    /// Fails with ClientError::STOPPER_STOPPED after stop()
    outcome::result<void> runAsyncTask(std::string name, Task task);

    /// Cancels running tasks, rejects new ones and waits for completion
    void stop();

    [[nodiscard]] size_t runningTasks() const;

    /// Threads not joined yet, finished ones included
    [[nodiscard]] size_t workerCount() const;

   private:
    Context quiesce_;

    mutable std::mutex mutex_;
    bool stopped_ = false;
    size_t running_ = 0;
    uint64_t next_worker_id_ = 0;
    std::unordered_map<uint64_t, std::thread> workers_;
    // finished workers, joined by the next runAsyncTask() or stop()
    std::vector<std::thread> finished_;
  };

}  // namespace shardkv::client
