/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/value.hpp"

#include <bit>

#include <boost/endian/conversion.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(shardkv::api, ValueError, e) {
  using E = shardkv::api::ValueError;
  switch (e) {
    case E::WRONG_TYPE:
      return "Value has a different type";
    case E::BAD_LENGTH:
      return "Value payload has wrong length";
  }
  return "Unknown api::ValueError";
}

namespace shardkv::api {

  namespace {
    qtils::ByteVec fixed64(uint64_t value) {
      qtils::ByteVec raw(sizeof(value));
      boost::endian::store_big_u64(raw.data(), value);
      return raw;
    }
  }  // namespace

  Value::Value(ValueType tag, qtils::ByteVec raw)
      : tag_(tag), raw_(std::move(raw)) {}

  Value Value::makeInt(int64_t value) {
    return {ValueType::INT, fixed64(static_cast<uint64_t>(value))};
  }

  Value Value::makeFloat(double value) {
    return {ValueType::FLOAT, fixed64(std::bit_cast<uint64_t>(value))};
  }

  Value Value::makeBytes(qtils::BytesIn bytes) {
    return {ValueType::BYTES, qtils::ByteVec{bytes}};
  }

  Value Value::makeString(std::string_view str) {
    return makeBytes(qtils::str2byte(str));
  }

  Value Value::makeTime(TimePoint time) {
    auto nsec = std::chrono::duration_cast<std::chrono::nanoseconds>(
        time.time_since_epoch());
    return {ValueType::TIME, fixed64(static_cast<uint64_t>(nsec.count()))};
  }

  Value Value::makeDuration(std::chrono::nanoseconds duration) {
    return {ValueType::DURATION,
            fixed64(static_cast<uint64_t>(duration.count()))};
  }

  outcome::result<uint64_t> Value::getFixed64(ValueType expected) const {
    if (tag_ != expected) {
      return ValueError::WRONG_TYPE;
    }
    if (raw_.size() != sizeof(uint64_t)) {
      return ValueError::BAD_LENGTH;
    }
    return boost::endian::load_big_u64(raw_.data());
  }

  outcome::result<int64_t> Value::getInt() const {
    OUTCOME_TRY(fixed, getFixed64(ValueType::INT));
    return static_cast<int64_t>(fixed);
  }

  outcome::result<double> Value::getFloat() const {
    OUTCOME_TRY(fixed, getFixed64(ValueType::FLOAT));
    return std::bit_cast<double>(fixed);
  }

  outcome::result<qtils::ByteVec> Value::getBytes() const {
    if (tag_ != ValueType::BYTES) {
      return ValueError::WRONG_TYPE;
    }
    return raw_;
  }

  outcome::result<Value::TimePoint> Value::getTime() const {
    OUTCOME_TRY(fixed, getFixed64(ValueType::TIME));
    return TimePoint{std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::nanoseconds{static_cast<int64_t>(fixed)})};
  }

  outcome::result<std::chrono::nanoseconds> Value::getDuration() const {
    OUTCOME_TRY(fixed, getFixed64(ValueType::DURATION));
    return std::chrono::nanoseconds{static_cast<int64_t>(fixed)};
  }

}  // namespace shardkv::api
