/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "api/batch.hpp"
#include "api/kv_error.hpp"
#include "api/value.hpp"
#include "client/key_value.hpp"

using shardkv::api::decodeValue;
using shardkv::api::encodeValue;
using shardkv::api::keyFromString;
using shardkv::api::KvError;
using shardkv::api::Value;
using shardkv::api::ValueError;
using shardkv::api::ValueType;
using shardkv::client::KeyValue;

/**
 * @given an integer value
 * @when it is encoded
 * @then its raw bytes are the big-endian 8-byte representation
 */
TEST(ValueTest, IntIsBigEndianFixed64) {
  ASSERT_OUTCOME_SUCCESS(value, encodeValue(int64_t{0x0102030405060708}));
  EXPECT_EQ(value.tag(), ValueType::INT);
  qtils::ByteVec expected{1, 2, 3, 4, 5, 6, 7, 8};
  EXPECT_EQ(value.rawBytes(), expected);
  ASSERT_OUTCOME_SUCCESS(decoded, decodeValue<int64_t>(value));
  EXPECT_EQ(decoded, 0x0102030405060708);
}

/**
 * @given values of several supported types
 * @when they are encoded and decoded back
 * @then the original values are returned
 */
TEST(ValueTest, TypedValues) {
  ASSERT_OUTCOME_SUCCESS(number, encodeValue(2.5));
  ASSERT_OUTCOME_SUCCESS(decoded_number, decodeValue<double>(number));
  EXPECT_EQ(decoded_number, 2.5);

  ASSERT_OUTCOME_SUCCESS(str, encodeValue("hello"));
  EXPECT_EQ(str.tag(), ValueType::BYTES);
  ASSERT_OUTCOME_SUCCESS(decoded_str, decodeValue<std::string>(str));
  EXPECT_EQ(decoded_str, "hello");

  auto time = std::chrono::system_clock::time_point{std::chrono::seconds{42}};
  ASSERT_OUTCOME_SUCCESS(time_value, encodeValue(time));
  ASSERT_OUTCOME_SUCCESS(decoded_time,
                         decodeValue<Value::TimePoint>(time_value));
  EXPECT_EQ(decoded_time, time);

  std::chrono::nanoseconds duration{-1500};
  ASSERT_OUTCOME_SUCCESS(duration_value, encodeValue(duration));
  ASSERT_OUTCOME_SUCCESS(
      decoded_duration,
      decodeValue<std::chrono::nanoseconds>(duration_value));
  EXPECT_EQ(decoded_duration, duration);
}

/**
 * @given a bytes value
 * @when it is read as an integer
 * @then WRONG_TYPE is returned
 */
TEST(ValueTest, WrongType) {
  auto value = Value::makeString("abc");
  EXPECT_OUTCOME_ERROR(value.getInt(), ValueError::WRONG_TYPE);
  EXPECT_OUTCOME_ERROR(value.getTime(), ValueError::WRONG_TYPE);
}

/**
 * @given rows with and without values
 * @when typed accessors are used
 * @then absent values read as defaults and mistyped ones throw
 */
TEST(ValueTest, KeyValueAccessors) {
  KeyValue absent{.key = keyFromString("a"), .value = std::nullopt};
  EXPECT_FALSE(absent.exists());
  EXPECT_EQ(absent.valueInt(), 0);
  EXPECT_TRUE(absent.valueBytes().empty());
  EXPECT_EQ(absent.prettyValue(), "nil");

  KeyValue integer{.key = keyFromString("b"), .value = Value::makeInt(-7)};
  EXPECT_EQ(integer.valueInt(), -7);
  EXPECT_EQ(integer.prettyValue(), "-7");
  EXPECT_ANY_THROW(std::ignore = integer.valueBytes());

  KeyValue bytes{.key = keyFromString("c"), .value = Value::makeString("x")};
  EXPECT_EQ(bytes.prettyValue(), "\"x\"");
  EXPECT_ANY_THROW(std::ignore = bytes.valueInt());
  ASSERT_OUTCOME_SUCCESS(str, bytes.valueAs<std::string>());
  EXPECT_EQ(str, "x");
}

/**
 * @given keys with unprintable bytes
 * @when they are pretty printed
 * @then the unprintable bytes are escaped
 */
TEST(KeyTest, PrettyKeyAndSpans) {
  qtils::ByteVec key{'a', 0x00, 0xff};
  EXPECT_EQ(shardkv::api::prettyKey(key), "\"a\\x00\\xff\"");

  shardkv::api::Span single{.key = keyFromString("k"), .end_key = {}};
  EXPECT_TRUE(single.contains(keyFromString("k")));
  EXPECT_FALSE(single.contains(keyFromString("k0")));

  shardkv::api::Span range{.key = keyFromString("a"),
                           .end_key = keyFromString("c")};
  EXPECT_TRUE(range.contains(keyFromString("b")));
  EXPECT_FALSE(range.contains(keyFromString("c")));
  EXPECT_TRUE(range.overlaps(keyFromString("bz"), keyFromString("d")));
  EXPECT_FALSE(range.overlaps(keyFromString("c"), keyFromString("d")));
}

/**
 * @given batches with inconsistent read consistency
 * @when checked for support
 * @then only non-transactional reads are accepted
 */
TEST(BatchRequestTest, SupportsBatch) {
  using shardkv::api::BatchRequest;
  using shardkv::api::ReadConsistency;

  BatchRequest reads;
  reads.requests.emplace_back(shardkv::api::GetRequest{keyFromString("a")});
  reads.requests.emplace_back(shardkv::api::ScanRequest{
      .span = {keyFromString("a"), keyFromString("b")}});
  EXPECT_OUTCOME_SUCCESS(
      shardkv::api::supportsBatch(ReadConsistency::INCONSISTENT, reads));

  auto writes = reads;
  writes.requests.emplace_back(shardkv::api::PutRequest{
      .key = keyFromString("a"), .value = Value::makeInt(1)});
  EXPECT_OUTCOME_SUCCESS(
      shardkv::api::supportsBatch(ReadConsistency::CONSISTENT, writes));
  EXPECT_OUTCOME_ERROR(
      shardkv::api::supportsBatch(ReadConsistency::READ_UNCOMMITTED, writes),
      KvError::UNSUPPORTED_READ_CONSISTENCY);

  auto txn_reads = reads;
  txn_reads.header.txn = shardkv::api::TxnMeta{};
  EXPECT_OUTCOME_ERROR(
      shardkv::api::supportsBatch(ReadConsistency::INCONSISTENT, txn_reads),
      KvError::UNSUPPORTED_READ_CONSISTENCY);
}
