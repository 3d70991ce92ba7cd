/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/batch.hpp"

#include <stdexcept>

#include <qtils/visit_in_place.hpp>

#include "client/client_error.hpp"

namespace shardkv::client {

  namespace {
    std::vector<KeyValue> toRows(const std::vector<api::KeyValuePair> &pairs) {
      std::vector<KeyValue> rows;
      rows.reserve(pairs.size());
      for (auto &pair : pairs) {
        rows.emplace_back(KeyValue{.key = pair.key, .value = pair.value});
      }
      return rows;
    }
  }  // namespace

  void Batch::initResult(size_t calls,
                         size_t num_rows,
                         bool raw,
                         std::error_code err) {
    if (not err) {
      if (raw_.has_value() and *raw_ != raw) {
        err = ClientError::MIXED_RAW_REQUESTS;
      } else {
        raw_ = raw;
      }
    }
    Result result{.calls = calls, .err = err};
    result.rows.resize(num_rows);
    results.emplace_back(std::move(result));
  }

  void Batch::appendReq(api::Request request, size_t num_rows) {
    reqs_.emplace_back(std::move(request));
    initResult(1, num_rows, false, {});
  }

  void Batch::del(const std::vector<api::Key> &keys) {
    for (auto &key : keys) {
      reqs_.emplace_back(api::DeleteRequest{.key = key});
    }
    initResult(keys.size(), keys.size(), false, {});
  }

  void Batch::addRawRequest(api::Request request) {
    size_t num_rows = 0;
    if (std::holds_alternative<api::GetRequest>(request)
        or std::holds_alternative<api::PutRequest>(request)
        or std::holds_alternative<api::ConditionalPutRequest>(request)
        or std::holds_alternative<api::InitPutRequest>(request)
        or std::holds_alternative<api::IncrementRequest>(request)
        or std::holds_alternative<api::DeleteRequest>(request)) {
      num_rows = 1;
    }
    reqs_.emplace_back(std::move(request));
    initResult(1, num_rows, true, {});
  }

  void Batch::appendEndTransaction(bool commit) {
    reqs_.emplace_back(api::EndTransactionRequest{.commit = commit});
    initResult(1, 0, raw_.value_or(false), {});
  }

  void Batch::adminSplit(const api::Key &span_key, const api::Key &split_key) {
    appendReq(api::AdminSplitRequest{.key = span_key, .split_key = split_key},
              0);
  }

  void Batch::adminMerge(const api::Key &key) {
    appendReq(api::AdminMergeRequest{.key = key}, 0);
  }

  void Batch::adminTransferLease(const api::Key &key, api::StoreId target) {
    appendReq(api::AdminTransferLeaseRequest{.key = key, .target = target}, 0);
  }

  void Batch::adminChangeReplicas(const api::Key &key,
                                  api::ReplicaChangeType change_type,
                                  std::vector<api::ReplicationTarget> targets,
                                  api::RangeDescriptor exp_desc) {
    appendReq(api::AdminChangeReplicasRequest{.key = key,
                                              .change_type = change_type,
                                              .targets = std::move(targets),
                                              .exp_desc = std::move(exp_desc)},
              0);
  }

  void Batch::adminRelocateRange(const api::Key &key,
                                 std::vector<api::ReplicationTarget> targets) {
    appendReq(api::AdminRelocateRangeRequest{.key = key,
                                             .targets = std::move(targets)},
              0);
  }

  outcome::result<void> Batch::prepare() {
    if (used_) {
      return ClientError::BATCH_ALREADY_USED;
    }
    used_ = true;
    std::error_code first;
    for (auto &result : results) {
      if (result.err) {
        first = result.err;
        break;
      }
    }
    if (not first) {
      return outcome::success();
    }
    for (auto &result : results) {
      if (not result.err) {
        result.err = ClientError::BATCH_NOT_SENT;
      }
    }
    return first;
  }

  std::error_code Batch::resultErr() const {
    for (auto &result : results) {
      if (result.err) {
        return result.err;
      }
    }
    return {};
  }

  outcome::result<void> Batch::sendAndFill(const SendFn &send) {
    api::BatchRequest ba{.header = header, .requests = reqs_};
    auto res = send(std::move(ba));
    if (res.has_value()) {
      response_ = std::move(res.value());
    } else {
      batch_err_ = res.error();
    }
    fillResults();
    if (auto err = resultErr()) {
      return err;
    }
    if (batch_err_) {
      return batch_err_;
    }
    return outcome::success();
  }

  void Batch::fillResults() {
    std::vector<const api::Response *> replies(reqs_.size(), nullptr);
    if (response_) {
      for (auto &indexed : response_->responses) {
        if (indexed.index < replies.size()
            and replies[indexed.index] == nullptr) {
          replies[indexed.index] = &indexed.response;
        }
      }
    }

    size_t offset = 0;
    for (auto &result : results) {
      for (size_t k = 0; k < result.calls; ++k) {
        auto &request = reqs_[offset + k];
        const api::Response *reply = nullptr;
        if (not result.err) {
          result.err = batch_err_;
          if (not result.err) {
            reply = replies[offset + k];
            // EndTransaction may be elided for read-only transactions
            if (reply == nullptr and not api::isEndTransaction(request)) {
              result.err = ClientError::MISSING_RESPONSE;
            }
          }
        }
        fillCall(result, k, request, reply);
        if (not result.err and reply != nullptr) {
          auto &header = api::responseHeader(*reply);
          if (header.resume_span) {
            result.resume_span = header.resume_span;
            result.resume_reason = header.resume_reason;
          }
        }
      }
      offset += result.calls;
    }
  }

  void Batch::fillCall(Result &result,
                       size_t k,
                       const api::Request &request,
                       const api::Response *reply) {
    auto response = [&]<typename T>() -> const T * {
      if (reply == nullptr or result.err) {
        return nullptr;
      }
      auto typed = std::get_if<T>(reply);
      if (typed == nullptr) {
        result.err = ClientError::UNEXPECTED_RESPONSE_TYPE;
      }
      return typed;
    };
    auto row = [&](const api::Key &key) -> KeyValue & {
      if (result.rows.size() <= k) {
        result.rows.resize(k + 1);
      }
      result.rows[k].key = key;
      return result.rows[k];
    };

    qtils::visit_in_place(
        request,
        [&](const api::GetRequest &req) {
          auto &kv = row(req.key);
          if (auto resp = response.operator()<api::GetResponse>()) {
            kv.value = resp->value;
          }
        },
        [&](const api::PutRequest &req) {
          auto &kv = row(req.key);
          if (response.operator()<api::PutResponse>()) {
            kv.value = req.value;
          }
        },
        [&](const api::ConditionalPutRequest &req) {
          auto &kv = row(req.key);
          if (response.operator()<api::ConditionalPutResponse>()) {
            kv.value = req.value;
          }
        },
        [&](const api::InitPutRequest &req) {
          auto &kv = row(req.key);
          if (response.operator()<api::InitPutResponse>()) {
            kv.value = req.value;
          }
        },
        [&](const api::IncrementRequest &req) {
          auto &kv = row(req.key);
          if (auto resp = response.operator()<api::IncrementResponse>()) {
            kv.value = api::Value::makeInt(resp->new_value);
          }
        },
        [&](const api::DeleteRequest &req) {
          row(req.key);
          response.operator()<api::DeleteResponse>();
        },
        [&](const api::DeleteRangeRequest &) {
          if (auto resp = response.operator()<api::DeleteRangeResponse>()) {
            result.keys = resp->keys;
          }
        },
        [&](const api::ScanRequest &) {
          if (auto resp = response.operator()<api::ScanResponse>()) {
            result.rows = toRows(resp->rows);
          }
        },
        [&](const api::ReverseScanRequest &) {
          if (auto resp = response.operator()<api::ReverseScanResponse>()) {
            result.rows = toRows(resp->rows);
          }
        },
        [&](const api::EndTransactionRequest &) {
          response.operator()<api::EndTransactionResponse>();
        },
        [&](const api::AdminSplitRequest &) {
          response.operator()<api::AdminSplitResponse>();
        },
        [&](const api::AdminMergeRequest &) {
          response.operator()<api::AdminMergeResponse>();
        },
        [&](const api::AdminTransferLeaseRequest &) {
          response.operator()<api::AdminTransferLeaseResponse>();
        },
        [&](const api::AdminChangeReplicasRequest &) {
          response.operator()<api::AdminChangeReplicasResponse>();
        },
        [&](const api::AdminRelocateRangeRequest &) {
          response.operator()<api::AdminRelocateRangeResponse>();
        });
  }

  outcome::result<void> getOneErr(const outcome::result<void> &run_res,
                                  const Batch &b) {
    if (run_res.has_error() and not b.results.empty()
        and b.results.front().err) {
      return b.results.front().err;
    }
    return run_res;
  }

  outcome::result<Result> getOneResult(const outcome::result<void> &run_res,
                                       const Batch &b) {
    if (run_res.has_error()) {
      if (not b.results.empty() and b.results.front().err) {
        return b.results.front().err;
      }
      return run_res.error();
    }
    if (b.results.empty()) {
      return ClientError::MISSING_RESPONSE;
    }
    auto &result = b.results.front();
    if (result.err) {
      throw std::logic_error{
          "run succeeded even though the result has an error"};
    }
    return result;
  }

  outcome::result<KeyValue> getOneRow(const outcome::result<void> &run_res,
                                      const Batch &b) {
    OUTCOME_TRY(result, getOneResult(run_res, b));
    if (result.rows.empty()) {
      return ClientError::MISSING_RESPONSE;
    }
    return std::move(result.rows.front());
  }

}  // namespace shardkv::client
