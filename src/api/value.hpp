/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/bytestr.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace shardkv::api {

  enum class ValueError : uint8_t {
    WRONG_TYPE = 1,
    BAD_LENGTH,
  };

  /// Tag describing how the raw bytes of a Value are encoded
  enum class ValueType : uint8_t {
    UNKNOWN = 0,
    INT = 1,
    FLOAT = 2,
    BYTES = 3,
    TIME = 4,
    DURATION = 5,
  };

  /**
   * Tagged byte payload stored under a key. Numeric payloads are fixed-width
   * big-endian.
   */
  class Value {
   public:
    using TimePoint = std::chrono::system_clock::time_point;

    Value() = default;

    static Value makeInt(int64_t value);
    static Value makeFloat(double value);
    static Value makeBytes(qtils::BytesIn bytes);
    static Value makeString(std::string_view str);
    static Value makeTime(TimePoint time);
    static Value makeDuration(std::chrono::nanoseconds duration);

    [[nodiscard]] ValueType tag() const {
      return tag_;
    }

    [[nodiscard]] const qtils::ByteVec &rawBytes() const {
      return raw_;
    }

    outcome::result<int64_t> getInt() const;
    outcome::result<double> getFloat() const;
    outcome::result<qtils::ByteVec> getBytes() const;
    outcome::result<TimePoint> getTime() const;
    outcome::result<std::chrono::nanoseconds> getDuration() const;

    bool operator==(const Value &other) const {
      return tag_ == other.tag_ and std::ranges::equal(raw_, other.raw_);
    }

   private:
    Value(ValueType tag, qtils::ByteVec raw);

    outcome::result<uint64_t> getFixed64(ValueType expected) const;

    ValueType tag_ = ValueType::UNKNOWN;
    qtils::ByteVec raw_;
  };

  /**
   * Typed-value codec. Specialize it for application types stored as
   * values; `encode` may fail, in which case the batch call that received
   * the value carries the error.
   */
  template <typename T>
  struct ValueCodec;

  template <typename T>
  concept EncodableValue = requires(const T &t, const Value &v) {
    { ValueCodec<T>::encode(t) } -> std::same_as<outcome::result<Value>>;
  };

  template <typename T>
  concept DecodableValue = requires(const Value &v) {
    { ValueCodec<T>::decode(v) } -> std::same_as<outcome::result<T>>;
  };

  template <>
  struct ValueCodec<Value> {
    static outcome::result<Value> encode(const Value &value) {
      return value;
    }
    static outcome::result<Value> decode(const Value &value) {
      return value;
    }
  };

  template <std::integral T>
  struct ValueCodec<T> {
    static outcome::result<Value> encode(const T &value) {
      return Value::makeInt(static_cast<int64_t>(value));
    }
    static outcome::result<T> decode(const Value &value) {
      OUTCOME_TRY(integer, value.getInt());
      return static_cast<T>(integer);
    }
  };

  template <std::floating_point T>
  struct ValueCodec<T> {
    static outcome::result<Value> encode(const T &value) {
      return Value::makeFloat(static_cast<double>(value));
    }
    static outcome::result<T> decode(const Value &value) {
      OUTCOME_TRY(number, value.getFloat());
      return static_cast<T>(number);
    }
  };

  template <>
  struct ValueCodec<std::string> {
    static outcome::result<Value> encode(const std::string &value) {
      return Value::makeString(value);
    }
    static outcome::result<std::string> decode(const Value &value) {
      OUTCOME_TRY(bytes, value.getBytes());
      return std::string{qtils::byte2str(bytes)};
    }
  };

  template <>
  struct ValueCodec<std::string_view> {
    static outcome::result<Value> encode(const std::string_view &value) {
      return Value::makeString(value);
    }
  };

  template <>
  struct ValueCodec<const char *> {
    static outcome::result<Value> encode(const char *const &value) {
      return Value::makeString(value);
    }
  };

  template <>
  struct ValueCodec<qtils::ByteVec> {
    static outcome::result<Value> encode(const qtils::ByteVec &value) {
      return Value::makeBytes(value);
    }
    static outcome::result<qtils::ByteVec> decode(const Value &value) {
      return value.getBytes();
    }
  };

  template <>
  struct ValueCodec<qtils::BytesIn> {
    static outcome::result<Value> encode(const qtils::BytesIn &value) {
      return Value::makeBytes(value);
    }
  };

  template <>
  struct ValueCodec<Value::TimePoint> {
    static outcome::result<Value> encode(const Value::TimePoint &value) {
      return Value::makeTime(value);
    }
    static outcome::result<Value::TimePoint> decode(const Value &value) {
      return value.getTime();
    }
  };

  template <>
  struct ValueCodec<std::chrono::nanoseconds> {
    static outcome::result<Value> encode(const std::chrono::nanoseconds &value) {
      return Value::makeDuration(value);
    }
    static outcome::result<std::chrono::nanoseconds> decode(
        const Value &value) {
      return value.getDuration();
    }
  };

  template <typename T>
  using CodecType = std::decay_t<const T>;

  /// Encodes any supported value; string literals decay to `const char *`
  template <typename T>
    requires EncodableValue<CodecType<T>>
  outcome::result<Value> encodeValue(const T &value) {
    return ValueCodec<CodecType<T>>::encode(value);
  }

  template <typename T>
    requires DecodableValue<T>
  outcome::result<T> decodeValue(const Value &value) {
    return ValueCodec<T>::decode(value);
  }

}  // namespace shardkv::api

OUTCOME_HPP_DECLARE_ERROR(shardkv::api, ValueError);
