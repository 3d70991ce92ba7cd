/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <compare>
#include <cstdint>

#include <fmt/format.h>

namespace shardkv::api {

  /**
   * Hybrid logical timestamp: physical wall time in nanoseconds plus a
   * logical counter ordering events within the same wall time
   */
  struct Timestamp {
    int64_t wall_time = 0;
    int32_t logical = 0;

    auto operator<=>(const Timestamp &) const = default;

    [[nodiscard]] bool isEmpty() const {
      return wall_time == 0 and logical == 0;
    }

    [[nodiscard]] Timestamp next() const {
      return {.wall_time = wall_time, .logical = logical + 1};
    }
  };

}  // namespace shardkv::api

template <>
struct fmt::formatter<shardkv::api::Timestamp> {
  constexpr auto parse(format_parse_context &ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const shardkv::api::Timestamp &ts, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(),
                          "{}.{:09d},{}",
                          ts.wall_time / 1'000'000'000,
                          ts.wall_time % 1'000'000'000,
                          ts.logical);
  }
};
