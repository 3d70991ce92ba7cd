/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <concepts>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/bytestr.hpp>

namespace shardkv::api {

  /// Opaque byte-string key, ordered lexicographically by bytes
  using Key = qtils::ByteVec;

  inline Key keyFromString(std::string_view str) {
    return Key{qtils::str2byte(str)};
  }

  /// Anything usable as a key: character strings or byte ranges
  template <typename K>
  concept KeyLike = std::convertible_to<const K &, std::string_view>
                 or std::convertible_to<const K &, qtils::BytesIn>;

  template <KeyLike K>
  Key toKey(const K &key) {
    if constexpr (std::convertible_to<const K &, std::string_view>) {
      return keyFromString(std::string_view{key});
    } else {
      return Key{qtils::BytesIn{key}};
    }
  }

  /// Lowest possible key
  inline const Key kKeyMin{};

  /// Upper bound of the addressable key space
  inline const Key kKeyMax{0xff, 0xff};

  inline bool keyLess(const Key &lhs, const Key &rhs) {
    return std::ranges::lexicographical_compare(lhs, rhs);
  }

  inline bool keyEqual(const Key &lhs, const Key &rhs) {
    return std::ranges::equal(lhs, rhs);
  }

  struct KeyLess {
    bool operator()(const Key &lhs, const Key &rhs) const {
      return keyLess(lhs, rhs);
    }
  };

  /// The smallest key greater than `key`
  inline Key keyNext(const Key &key) {
    Key next{key};
    next.push_back(0);
    return next;
  }

  /// Printable form of a key: printable ASCII as is, other bytes escaped
  std::string prettyKey(const Key &key);

  /**
   * Half-open key interval [key, end_key). An empty end_key means the span
   * covers the single key `key`.
   */
  struct Span {
    Key key;
    Key end_key;

    bool operator==(const Span &other) const {
      return keyEqual(key, other.key) and keyEqual(end_key, other.end_key);
    }

    /// Exclusive upper bound, for single-key spans too
    [[nodiscard]] Key effectiveEnd() const {
      return end_key.empty() ? keyNext(key) : end_key;
    }

    [[nodiscard]] bool contains(const Key &k) const {
      return not keyLess(k, key) and keyLess(k, effectiveEnd());
    }

    [[nodiscard]] bool overlaps(const Key &start, const Key &end) const {
      return keyLess(key, end) and keyLess(start, effectiveEnd());
    }

    [[nodiscard]] bool empty() const {
      return not end_key.empty() and not keyLess(key, end_key);
    }
  };

}  // namespace shardkv::api

template <>
struct fmt::formatter<shardkv::api::Span> {
  constexpr auto parse(format_parse_context &ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const shardkv::api::Span &span, FormatContext &ctx) const {
    if (span.end_key.empty()) {
      return fmt::format_to(
          ctx.out(), "{}", shardkv::api::prettyKey(span.key));
    }
    return fmt::format_to(ctx.out(),
                          "[{}, {})",
                          shardkv::api::prettyKey(span.key),
                          shardkv::api::prettyKey(span.end_key));
  }
};
