/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <qtils/outcome.hpp>

#include "api/key.hpp"
#include "api/response.hpp"
#include "api/value.hpp"

namespace shardkv::client {

  /**
   * One key and its value as seen by a batch call. An absent value means
   * the key does not exist.
   */
  struct KeyValue {
    api::Key key;
    std::optional<api::Value> value;

    [[nodiscard]] bool exists() const {
      return value.has_value();
    }

    /// Human readable value, "nil" when absent
    [[nodiscard]] std::string prettyValue() const;

    /// Bytes of the value, empty when absent; raises if not BYTES
    [[nodiscard]] qtils::ByteVec valueBytes() const;

    /// Integer value, 0 when absent; raises if not INT
    [[nodiscard]] int64_t valueInt() const;

    /// Decodes the value, default constructed T when absent
    template <typename T>
      requires api::DecodableValue<T>
    outcome::result<T> valueAs() const {
      if (not value) {
        return T{};
      }
      return api::decodeValue<T>(*value);
    }
  };

  /**
   * Outcome of one logical call of a Batch. `calls` is the number of wire
   * requests the call produced.
   */
  struct Result {
    size_t calls = 0;
    std::error_code err;
    std::vector<KeyValue> rows;
    // keys reported by DelRange with return_keys
    std::vector<api::Key> keys;
    std::optional<api::Span> resume_span;
    api::ResumeReason resume_reason = api::ResumeReason::NONE;
  };

}  // namespace shardkv::client

template <>
struct fmt::formatter<shardkv::client::KeyValue> {
  constexpr auto parse(format_parse_context &ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const shardkv::client::KeyValue &kv, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(),
                          "{}={}",
                          shardkv::api::prettyKey(kv.key),
                          kv.prettyValue());
  }
};

template <>
struct fmt::formatter<shardkv::client::Result> {
  constexpr auto parse(format_parse_context &ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const shardkv::client::Result &result,
              FormatContext &ctx) const {
    if (result.err) {
      return fmt::format_to(ctx.out(), "{}", result.err.message());
    }
    auto out = ctx.out();
    for (size_t i = 0; i < result.rows.size(); ++i) {
      out = fmt::format_to(out, "{}{}: {}", i == 0 ? "" : "\n", i,
                           result.rows[i]);
    }
    return out;
  }
};
