/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/context.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(shardkv::client, ContextError, e) {
  using E = shardkv::client::ContextError;
  switch (e) {
    case E::CANCELED:
      return "context canceled";
    case E::DEADLINE_EXCEEDED:
      return "context deadline exceeded";
  }
  return "Unknown client::ContextError";
}

namespace shardkv::client {

  Context::Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

  Context Context::background() {
    return Context{std::make_shared<State>()};
  }

  Context Context::derive(std::optional<TimePoint> deadline) const {
    auto child = std::make_shared<State>();
    std::lock_guard lock(state_->mutex);
    child->cancelled = state_->cancelled;
    child->deadline = state_->deadline;
    if (deadline and (not child->deadline or *deadline < *child->deadline)) {
      child->deadline = deadline;
    }
    std::erase_if(state_->children,
                  [](const std::weak_ptr<State> &w) { return w.expired(); });
    state_->children.emplace_back(child);
    return Context{std::move(child)};
  }

  Context Context::withCancel() const {
    return derive(std::nullopt);
  }

  Context Context::withDeadline(TimePoint deadline) const {
    return derive(deadline);
  }

  Context Context::withTimeout(Clock::duration timeout) const {
    return derive(Clock::now() + timeout);
  }

  void Context::cancelState(const std::shared_ptr<State> &state) {
    std::vector<std::weak_ptr<State>> children;
    {
      std::lock_guard lock(state->mutex);
      if (state->cancelled) {
        return;
      }
      state->cancelled = true;
      children.swap(state->children);
    }
    state->cv.notify_all();
    for (auto &weak : children) {
      if (auto child = weak.lock()) {
        cancelState(child);
      }
    }
  }

  void Context::cancel() const {
    cancelState(state_);
  }

  outcome::result<void> Context::err() const {
    std::lock_guard lock(state_->mutex);
    if (state_->cancelled) {
      return ContextError::CANCELED;
    }
    if (state_->deadline and Clock::now() >= *state_->deadline) {
      return ContextError::DEADLINE_EXCEEDED;
    }
    return outcome::success();
  }

  std::optional<Context::TimePoint> Context::deadline() const {
    std::lock_guard lock(state_->mutex);
    return state_->deadline;
  }

  bool Context::waitFor(Clock::duration duration) const {
    {
      std::unique_lock lock(state_->mutex);
      auto until = Clock::now() + duration;
      if (state_->deadline and *state_->deadline < until) {
        until = *state_->deadline;
      }
      state_->cv.wait_until(lock, until, [&] { return state_->cancelled; });
    }
    return not done();
  }

}  // namespace shardkv::client
