/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/request.hpp"

#include <qtils/visit_in_place.hpp>

namespace shardkv::api {

  std::string_view methodName(const Request &request) {
    return qtils::visit_in_place(
        request,
        [](const GetRequest &) { return "Get"; },
        [](const PutRequest &) { return "Put"; },
        [](const ConditionalPutRequest &) { return "ConditionalPut"; },
        [](const InitPutRequest &) { return "InitPut"; },
        [](const IncrementRequest &) { return "Increment"; },
        [](const DeleteRequest &) { return "Delete"; },
        [](const DeleteRangeRequest &) { return "DeleteRange"; },
        [](const ScanRequest &) { return "Scan"; },
        [](const ReverseScanRequest &) { return "ReverseScan"; },
        [](const EndTransactionRequest &) { return "EndTransaction"; },
        [](const AdminSplitRequest &) { return "AdminSplit"; },
        [](const AdminMergeRequest &) { return "AdminMerge"; },
        [](const AdminTransferLeaseRequest &) { return "AdminTransferLease"; },
        [](const AdminChangeReplicasRequest &) {
          return "AdminChangeReplicas";
        },
        [](const AdminRelocateRangeRequest &) {
          return "AdminRelocateRange";
        });
  }

  std::optional<Span> requestSpan(const Request &request) {
    return qtils::visit_in_place(
        request,
        [](const EndTransactionRequest &) -> std::optional<Span> {
          return std::nullopt;
        },
        [](const DeleteRangeRequest &r) -> std::optional<Span> {
          return r.span;
        },
        [](const ScanRequest &r) -> std::optional<Span> { return r.span; },
        [](const ReverseScanRequest &r) -> std::optional<Span> {
          return r.span;
        },
        [](const auto &r) -> std::optional<Span> { return Span{r.key, {}}; });
  }

  bool isWrite(const Request &request) {
    return std::holds_alternative<PutRequest>(request)
        or std::holds_alternative<ConditionalPutRequest>(request)
        or std::holds_alternative<InitPutRequest>(request)
        or std::holds_alternative<IncrementRequest>(request)
        or std::holds_alternative<DeleteRequest>(request)
        or std::holds_alternative<DeleteRangeRequest>(request);
  }

  bool isRange(const Request &request) {
    return std::holds_alternative<ScanRequest>(request)
        or std::holds_alternative<ReverseScanRequest>(request)
        or std::holds_alternative<DeleteRangeRequest>(request);
  }

  bool isAdmin(const Request &request) {
    return std::holds_alternative<AdminSplitRequest>(request)
        or std::holds_alternative<AdminMergeRequest>(request)
        or std::holds_alternative<AdminTransferLeaseRequest>(request)
        or std::holds_alternative<AdminChangeReplicasRequest>(request)
        or std::holds_alternative<AdminRelocateRangeRequest>(request);
  }

}  // namespace shardkv::api
