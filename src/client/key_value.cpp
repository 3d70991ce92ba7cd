/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/key_value.hpp"

#include <fmt/chrono.h>
#include <fmt/ranges.h>

namespace shardkv::client {

  std::string KeyValue::prettyValue() const {
    if (not value) {
      return "nil";
    }
    switch (value->tag()) {
      case api::ValueType::INT:
        if (auto res = value->getInt(); res.has_value()) {
          return fmt::format("{}", res.value());
        }
        break;
      case api::ValueType::FLOAT:
        if (auto res = value->getFloat(); res.has_value()) {
          return fmt::format("{}", res.value());
        }
        break;
      case api::ValueType::BYTES:
        return api::prettyKey(value->rawBytes());
      case api::ValueType::TIME:
        if (auto res = value->getTime(); res.has_value()) {
          return fmt::format("{:%Y-%m-%d %H:%M:%S}", res.value());
        }
        break;
      case api::ValueType::DURATION:
        if (auto res = value->getDuration(); res.has_value()) {
          return fmt::format("{}", res.value());
        }
        break;
      case api::ValueType::UNKNOWN:
        break;
    }
    return fmt::format("{:02x}", fmt::join(value->rawBytes(), ""));
  }

  qtils::ByteVec KeyValue::valueBytes() const {
    if (not value) {
      return {};
    }
    auto res = value->getBytes();
    if (res.has_error()) {
      qtils::raise(res.error());
    }
    return std::move(res.value());
  }

  int64_t KeyValue::valueInt() const {
    if (not value) {
      return 0;
    }
    auto res = value->getInt();
    if (res.has_error()) {
      qtils::raise(res.error());
    }
    return res.value();
  }

}  // namespace shardkv::client
