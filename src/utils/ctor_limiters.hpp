/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <concepts>
#include <stdexcept>
#include <type_traits>
#include <typeinfo>

#include <fmt/format.h>

namespace shardkv {

  /// Base of classes whose instances must not be copied
  class NonCopyable {
   public:
    NonCopyable() = default;
    ~NonCopyable() = default;
    NonCopyable(const NonCopyable &) = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;
    NonCopyable(NonCopyable &&) = default;
    NonCopyable &operator=(NonCopyable &&) = default;
  };

  /// Base of classes whose instances are referenced by address
  class NonMovable {
   public:
    NonMovable() = default;
    ~NonMovable() = default;
    NonMovable(NonMovable &&) = delete;
    NonMovable &operator=(NonMovable &&) = delete;
    NonMovable(const NonMovable &) = default;
    NonMovable &operator=(const NonMovable &) = default;
  };

  /**
   * Allows at most one live instance of T per process. A second
   * construction throws std::logic_error; destroying the instance allows a
   * new one.
   */
  template <typename T>
    requires std::same_as<T, std::decay_t<T>>
  class Singleton : NonCopyable, NonMovable {
   public:
    Singleton() {
      if (alive_.test_and_set(std::memory_order_acquire)) {
        throw std::logic_error{fmt::format(
            "Instance of singleton '{}' already exists", typeid(T).name())};
      }
    }

    ~Singleton() {
      alive_.clear(std::memory_order_release);
    }

    static bool exists() {
      return alive_.test(std::memory_order_acquire);
    }

   private:
    inline static std::atomic_flag alive_{};
  };

}  // namespace shardkv
