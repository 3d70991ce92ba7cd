/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/key.hpp"

namespace shardkv::api {

  std::string prettyKey(const Key &key) {
    std::string out;
    out.reserve(key.size() + 2);
    out.push_back('"');
    for (auto byte : key) {
      if (byte == '"' or byte == '\\') {
        out.push_back('\\');
        out.push_back(static_cast<char>(byte));
      } else if (byte >= 0x20 and byte < 0x7f) {
        out.push_back(static_cast<char>(byte));
      } else {
        out += fmt::format("\\x{:02x}", byte);
      }
    }
    out.push_back('"');
    return out;
  }

}  // namespace shardkv::api
