/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/stopper.hpp"

#include <soralog/util.hpp>

#include "client/client_error.hpp"

namespace shardkv::client {

  namespace {
    void joinAll(std::vector<std::thread> &threads) {
      for (auto &thread : threads) {
        if (thread.joinable()) {
          thread.join();
        }
      }
    }
  }  // namespace

  Stopper::Stopper() : quiesce_(Context::background()) {}

  Stopper::~Stopper() {
    stop();
  }

  outcome::result<void> Stopper::runAsyncTask(std::string name, Task task) {
    std::vector<std::thread> finished;
    {
      std::lock_guard lock(mutex_);
      if (stopped_) {
        return ClientError::STOPPER_STOPPED;
      }
      finished.swap(finished_);
      auto id = next_worker_id_++;
      ++running_;
      auto body = [this, id, name = std::move(name), task = std::move(task)] {
        soralog::util::setThreadName(name);
        task(quiesce_);
        std::lock_guard lock(mutex_);
        --running_;
        // stop() may have taken the handle already
        if (auto it = workers_.find(id); it != workers_.end()) {
          finished_.push_back(std::move(it->second));
          workers_.erase(it);
        }
      };
      workers_.emplace(id, std::thread{std::move(body)});
    }
    joinAll(finished);
    return outcome::success();
  }

  void Stopper::stop() {
    std::vector<std::thread> workers;
    {
      std::lock_guard lock(mutex_);
      stopped_ = true;
      workers.swap(finished_);
      for (auto &[_, worker] : workers_) {
        workers.push_back(std::move(worker));
      }
      workers_.clear();
    }
    quiesce_.cancel();
    joinAll(workers);
  }

  size_t Stopper::runningTasks() const {
    std::lock_guard lock(mutex_);
    return running_;
  }

  size_t Stopper::workerCount() const {
    std::lock_guard lock(mutex_);
    return workers_.size() + finished_.size();
  }

}  // namespace shardkv::client
