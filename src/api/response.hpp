/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <variant>
#include <vector>

#include "api/key.hpp"
#include "api/range.hpp"
#include "api/value.hpp"

namespace shardkv::api {

  enum class ResumeReason : uint8_t {
    NONE = 0,
    // max_span_request_keys of the batch was exhausted
    KEY_LIMIT,
  };

  struct ResponseHeader {
    // remainder of the request span which was not processed
    std::optional<Span> resume_span;
    ResumeReason resume_reason = ResumeReason::NONE;
    int64_t num_keys = 0;
  };

  /// A stored key with its value, as returned by scans
  struct KeyValuePair {
    Key key;
    Value value;
  };

  struct GetResponse {
    ResponseHeader header;
    std::optional<Value> value;
  };

  struct PutResponse {
    ResponseHeader header;
  };

  struct ConditionalPutResponse {
    ResponseHeader header;
  };

  struct InitPutResponse {
    ResponseHeader header;
  };

  struct IncrementResponse {
    ResponseHeader header;
    int64_t new_value = 0;
  };

  struct DeleteResponse {
    ResponseHeader header;
  };

  struct DeleteRangeResponse {
    ResponseHeader header;
    std::vector<Key> keys;
  };

  struct ScanResponse {
    ResponseHeader header;
    std::vector<KeyValuePair> rows;
  };

  struct ReverseScanResponse {
    ResponseHeader header;
    std::vector<KeyValuePair> rows;
  };

  struct EndTransactionResponse {
    ResponseHeader header;
  };

  struct AdminSplitResponse {
    ResponseHeader header;
  };

  struct AdminMergeResponse {
    ResponseHeader header;
  };

  struct AdminTransferLeaseResponse {
    ResponseHeader header;
  };

  struct AdminChangeReplicasResponse {
    ResponseHeader header;
    RangeDescriptor desc;
  };

  struct AdminRelocateRangeResponse {
    ResponseHeader header;
  };

  // alternatives follow the order of api::Request
  using Response = std::variant<GetResponse,
                                PutResponse,
                                ConditionalPutResponse,
                                InitPutResponse,
                                IncrementResponse,
                                DeleteResponse,
                                DeleteRangeResponse,
                                ScanResponse,
                                ReverseScanResponse,
                                EndTransactionResponse,
                                AdminSplitResponse,
                                AdminMergeResponse,
                                AdminTransferLeaseResponse,
                                AdminChangeReplicasResponse,
                                AdminRelocateRangeResponse>;

  inline const ResponseHeader &responseHeader(const Response &response) {
    return std::visit(
        [](const auto &r) -> const ResponseHeader & { return r.header; },
        response);
  }

  inline ResponseHeader &responseHeader(Response &response) {
    return std::visit([](auto &r) -> ResponseHeader & { return r.header; },
                      response);
  }

  /// Wire response tagged with the index of the request it answers
  struct IndexedResponse {
    size_t index = 0;
    Response response;
  };

}  // namespace shardkv::api
