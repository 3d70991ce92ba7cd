/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "local/local_store.hpp"

#include <algorithm>
#include <numeric>
#include <tuple>

#include <qtils/visit_in_place.hpp>

#include "api/kv_error.hpp"

namespace shardkv::local {

  using api::KvError;

  struct LocalStore::Evaluation {
    // scratch copy of the transaction state, null outside transactions
    TxnState *txn = nullptr;
    // writes of a non-transactional batch
    WriteBuffer writes;
    std::optional<int64_t> remaining_keys;

    WriteBuffer &buffer() {
      return txn != nullptr ? txn->writes : writes;
    }

    [[nodiscard]] bool keyLimitReached() const {
      return remaining_keys.has_value() and *remaining_keys <= 0;
    }
  };

  LocalStore::LocalStore(qtils::SharedRef<log::LoggingSystem> logsys,
                         qtils::SharedRef<clock::HybridClock> clock,
                         StoreConfig config)
      : logger_(logsys->getLogger("LocalStore", log::storeGroupName)),
        clock_(std::move(clock)),
        config_(std::move(config)) {
    config_.nodes = std::max<size_t>(config_.nodes, 1);
    config_.replication_factor =
        std::clamp<size_t>(config_.replication_factor, 1, config_.nodes);

    std::vector<api::ReplicaDescriptor> replicas;
    for (size_t i = 1; i <= config_.replication_factor; ++i) {
      auto id = static_cast<int32_t>(i);
      replicas.push_back({.node_id = id, .store_id = id, .replica_id = id});
    }

    auto splits = config_.split_keys;
    std::ranges::sort(splits, api::keyLess);
    auto last = std::unique(splits.begin(), splits.end(), api::keyEqual);
    splits.erase(last, splits.end());
    std::erase_if(splits, [](const api::Key &key) {
      return key.empty() or not api::keyLess(key, api::kKeyMax);
    });

    api::Key start = api::kKeyMin;
    auto add_range = [&](const api::Key &end) {
      Range range{
          .desc =
              {
                  .range_id = next_range_id_++,
                  .start_key = start,
                  .end_key = end,
                  .replicas = replicas,
                  .next_replica_id =
                      static_cast<api::ReplicaId>(replicas.size() + 1),
                  .generation = 0,
              },
          .lease_holder = replicas.front().store_id,
      };
      ranges_.emplace(start, std::move(range));
      start = end;
    };
    for (auto &split : splits) {
      add_range(split);
    }
    add_range(api::kKeyMax);

    SL_DEBUG(logger_,
             "local store with {} nodes and {} ranges",
             config_.nodes,
             ranges_.size());
  }

  uint64_t LocalStore::currentSeq() const {
    std::lock_guard lock(mutex_);
    return seq_;
  }

  std::vector<api::RangeDescriptor> LocalStore::ranges() const {
    std::lock_guard lock(mutex_);
    std::vector<api::RangeDescriptor> descs;
    descs.reserve(ranges_.size());
    for (auto &[_, range] : ranges_) {
      descs.push_back(range.desc);
    }
    return descs;
  }

  api::RangeDescriptor LocalStore::rangeFor(const api::Key &key) const {
    std::lock_guard lock(mutex_);
    return findRange(key)->second.desc;
  }

  api::StoreId LocalStore::leaseHolder(const api::Key &key) const {
    std::lock_guard lock(mutex_);
    return findRange(key)->second.lease_holder;
  }

  std::vector<api::ReplicationTarget> LocalStore::stores() const {
    std::vector<api::ReplicationTarget> targets;
    for (size_t i = 1; i <= config_.nodes; ++i) {
      auto id = static_cast<int32_t>(i);
      targets.push_back({.node_id = id, .store_id = id});
    }
    return targets;
  }

  // The first range starts at the empty key, so every key has a range
  LocalStore::Ranges::iterator LocalStore::findRange(const api::Key &key) {
    return std::prev(ranges_.upper_bound(key));
  }

  LocalStore::Ranges::const_iterator LocalStore::findRange(
      const api::Key &key) const {
    return std::prev(ranges_.upper_bound(key));
  }

  size_t LocalStore::rangesTouched(const api::BatchRequest &ba) const {
    std::set<api::RangeId> touched;
    for (auto &request : ba.requests) {
      if (api::isAdmin(request)) {
        continue;
      }
      auto span = api::requestSpan(request);
      if (not span) {
        continue;
      }
      auto end = span->effectiveEnd();
      for (auto it = findRange(span->key);
           it != ranges_.end() and api::keyLess(it->first, end);
           ++it) {
        touched.insert(it->second.desc.range_id);
      }
    }
    return touched.size();
  }

  outcome::result<api::BatchResponse> LocalStore::evaluate(
      const api::BatchRequest &ba, TxnState *txn) {
    std::lock_guard lock(mutex_);

    if (txn == nullptr) {
      if (ba.hasEndTransaction()) {
        return KvError::INVALID_ARGUMENT;
      }
      if (ba.header.read_consistency == api::ReadConsistency::CONSISTENT
          and ba.hasWrite() and rangesTouched(ba) > 1) {
        SL_TRACE(logger_,
                 "non-transactional batch of {} requests spans ranges",
                 ba.requests.size());
        return KvError::OP_REQUIRES_TXN;
      }
    } else if (ba.hasAdmin()) {
      return KvError::INVALID_ARGUMENT;
    }

    std::optional<TxnState> scratch;
    if (txn != nullptr) {
      scratch = *txn;
    }
    // range layout to restore if a later request of the batch fails
    std::optional<std::pair<Ranges, api::RangeId>> layout;
    if (ba.hasAdmin()) {
      layout.emplace(ranges_, next_range_id_);
    }
    Evaluation eval{.txn = scratch ? &*scratch : nullptr};
    if (ba.header.max_span_request_keys > 0) {
      eval.remaining_keys = ba.header.max_span_request_keys;
    }

    // Requests are served range by range, EndTransaction goes last
    std::vector<std::optional<api::Key>> range_starts;
    range_starts.reserve(ba.requests.size());
    for (auto &request : ba.requests) {
      auto span = api::requestSpan(request);
      range_starts.emplace_back(
          span ? std::make_optional(findRange(span->key)->first)
               : std::nullopt);
    }
    std::vector<size_t> order(ba.requests.size());
    std::iota(order.begin(), order.end(), 0);
    std::ranges::stable_sort(order, [&](size_t lhs, size_t rhs) {
      auto &l = range_starts[lhs];
      auto &r = range_starts[rhs];
      if (not l or not r) {
        return l.has_value() and not r.has_value();
      }
      return api::keyLess(*l, *r);
    });

    api::BatchResponse br;
    std::optional<bool> end_txn_commit;
    for (auto index : order) {
      auto &request = ba.requests[index];
      if (auto end = std::get_if<api::EndTransactionRequest>(&request)) {
        end_txn_commit = end->commit;
        br.responses.push_back(
            {.index = index, .response = api::EndTransactionResponse{}});
        continue;
      }
      auto response = evaluateRequest(eval, request);
      if (response.has_error()) {
        if (layout) {
          std::tie(ranges_, next_range_id_) = std::move(*layout);
        }
        return response.error();
      }
      br.responses.push_back(
          {.index = index, .response = std::move(response.value())});
    }

    if (txn == nullptr) {
      if (not eval.writes.empty()) {
        apply(eval.writes);
      }
    } else if (end_txn_commit.has_value()) {
      if (*end_txn_commit) {
        if (auto res = validate(*scratch); res.has_error()) {
          SL_TRACE(logger_, "transaction {} failed validation", *ba.header.txn);
          return res.error();
        }
        if (not scratch->writes.empty()) {
          apply(scratch->writes);
        }
      }
      *txn = TxnState{};
    } else {
      *txn = std::move(*scratch);
    }

    br.header.now = clock_->now();
    return br;
  }

  outcome::result<std::optional<api::Value>> LocalStore::read(
      Evaluation &eval, const api::Key &key) {
    auto &buffer = eval.buffer();
    if (auto it = buffer.find(key); it != buffer.end()) {
      return it->second;
    }
    auto it = data_.find(key);
    if (eval.txn != nullptr) {
      if (it != data_.end() and it->second.mod_seq > eval.txn->read_seq) {
        return KvError::TRANSACTION_RETRY;
      }
      eval.txn->read_keys.insert(key);
    }
    if (it == data_.end()) {
      return std::optional<api::Value>{};
    }
    return it->second.value;
  }

  bool LocalStore::hasTombstone(Evaluation &eval, const api::Key &key) const {
    auto &buffer = eval.buffer();
    if (auto it = buffer.find(key); it != buffer.end()) {
      return not it->second.has_value();
    }
    auto it = data_.find(key);
    return it != data_.end() and not it->second.value.has_value();
  }

  outcome::result<LocalStore::ScanOutcome> LocalStore::scan(
      Evaluation &eval, const api::Span &span, bool reverse) {
    ScanOutcome scanned;
    if (eval.keyLimitReached()) {
      scanned.resume_span = span;
      return scanned;
    }

    auto end = span.effectiveEnd();
    std::map<api::Key, std::optional<api::Value>, api::KeyLess> view;
    for (auto it = data_.lower_bound(span.key);
         it != data_.end() and api::keyLess(it->first, end);
         ++it) {
      if (eval.txn != nullptr and it->second.mod_seq > eval.txn->read_seq) {
        return KvError::TRANSACTION_RETRY;
      }
      view.emplace(it->first, it->second.value);
    }
    auto &buffer = eval.buffer();
    for (auto it = buffer.lower_bound(span.key);
         it != buffer.end() and api::keyLess(it->first, end);
         ++it) {
      view.insert_or_assign(it->first, it->second);
    }
    if (eval.txn != nullptr) {
      eval.txn->read_spans.push_back({span.key, end});
    }

    auto visit = [&](const api::Key &key,
                     const std::optional<api::Value> &value) {
      if (not value) {
        return true;
      }
      if (eval.keyLimitReached()) {
        scanned.resume_span = reverse ? api::Span{span.key, api::keyNext(key)}
                                      : api::Span{key, end};
        return false;
      }
      scanned.rows.push_back({.key = key, .value = *value});
      if (eval.remaining_keys) {
        --*eval.remaining_keys;
      }
      return true;
    };
    if (reverse) {
      for (auto it = view.rbegin(); it != view.rend(); ++it) {
        if (not visit(it->first, it->second)) {
          break;
        }
      }
    } else {
      for (auto &[key, value] : view) {
        if (not visit(key, value)) {
          break;
        }
      }
    }
    return scanned;
  }

  outcome::result<void> LocalStore::validate(const TxnState &txn) const {
    auto changed = [&](const api::Key &key) {
      auto it = data_.find(key);
      return it != data_.end() and it->second.mod_seq > txn.read_seq;
    };
    for (auto &key : txn.read_keys) {
      if (changed(key)) {
        return KvError::TRANSACTION_RETRY;
      }
    }
    for (auto &[key, _] : txn.writes) {
      if (changed(key)) {
        return KvError::TRANSACTION_RETRY;
      }
    }
    for (auto &span : txn.read_spans) {
      auto end = span.effectiveEnd();
      for (auto it = data_.lower_bound(span.key);
           it != data_.end() and api::keyLess(it->first, end);
           ++it) {
        if (it->second.mod_seq > txn.read_seq) {
          return KvError::TRANSACTION_RETRY;
        }
      }
    }
    return outcome::success();
  }

  void LocalStore::apply(const WriteBuffer &writes) {
    ++seq_;
    for (auto &[key, value] : writes) {
      data_.insert_or_assign(key, Entry{.value = value, .mod_seq = seq_});
    }
  }

  outcome::result<api::Response> LocalStore::evaluateRequest(
      Evaluation &eval, const api::Request &request) {
    using Res = outcome::result<api::Response>;
    auto limited = [](api::ResponseHeader &header,
                      const std::optional<api::Span> &resume_span,
                      size_t num_keys) {
      header.num_keys = static_cast<int64_t>(num_keys);
      if (resume_span) {
        header.resume_span = resume_span;
        header.resume_reason = api::ResumeReason::KEY_LIMIT;
      }
    };

    return qtils::visit_in_place(
        request,
        [&](const api::GetRequest &req) -> Res {
          OUTCOME_TRY(value, read(eval, req.key));
          api::GetResponse resp;
          resp.header.num_keys = value ? 1 : 0;
          resp.value = std::move(value);
          return api::Response{std::move(resp)};
        },
        [&](const api::PutRequest &req) -> Res {
          if (eval.txn != nullptr and req.inline_value) {
            return KvError::INVALID_ARGUMENT;
          }
          eval.buffer().insert_or_assign(req.key, req.value);
          return api::Response{api::PutResponse{}};
        },
        [&](const api::ConditionalPutRequest &req) -> Res {
          OUTCOME_TRY(current, read(eval, req.key));
          bool matches = req.exp_value.has_value()
                           ? current.has_value() and *current == *req.exp_value
                           : not current.has_value();
          if (not matches) {
            return KvError::CONDITION_FAILED;
          }
          eval.buffer().insert_or_assign(req.key, req.value);
          return api::Response{api::ConditionalPutResponse{}};
        },
        [&](const api::InitPutRequest &req) -> Res {
          OUTCOME_TRY(current, read(eval, req.key));
          if (current.has_value()) {
            if (not(*current == req.value)) {
              return KvError::CONDITION_FAILED;
            }
          } else if (req.fail_on_tombstones
                     and hasTombstone(eval, req.key)) {
            return KvError::CONDITION_FAILED;
          }
          eval.buffer().insert_or_assign(req.key, req.value);
          return api::Response{api::InitPutResponse{}};
        },
        [&](const api::IncrementRequest &req) -> Res {
          OUTCOME_TRY(current, read(eval, req.key));
          int64_t base = 0;
          if (current.has_value()) {
            auto integer = current->getInt();
            if (integer.has_error()) {
              return KvError::VALUE_TYPE_MISMATCH;
            }
            base = integer.value();
          }
          auto new_value = base + req.increment;
          eval.buffer().insert_or_assign(req.key,
                                         api::Value::makeInt(new_value));
          return api::Response{api::IncrementResponse{.new_value = new_value}};
        },
        [&](const api::DeleteRequest &req) -> Res {
          eval.buffer().insert_or_assign(req.key, std::nullopt);
          return api::Response{api::DeleteResponse{}};
        },
        [&](const api::DeleteRangeRequest &req) -> Res {
          OUTCOME_TRY(scanned, scan(eval, req.span, false));
          api::DeleteRangeResponse resp;
          for (auto &row : scanned.rows) {
            eval.buffer().insert_or_assign(row.key, std::nullopt);
            if (req.return_keys) {
              resp.keys.push_back(row.key);
            }
          }
          limited(resp.header, scanned.resume_span, scanned.rows.size());
          return api::Response{std::move(resp)};
        },
        [&](const api::ScanRequest &req) -> Res {
          OUTCOME_TRY(scanned, scan(eval, req.span, false));
          api::ScanResponse resp;
          limited(resp.header, scanned.resume_span, scanned.rows.size());
          resp.rows = std::move(scanned.rows);
          return api::Response{std::move(resp)};
        },
        [&](const api::ReverseScanRequest &req) -> Res {
          OUTCOME_TRY(scanned, scan(eval, req.span, true));
          api::ReverseScanResponse resp;
          limited(resp.header, scanned.resume_span, scanned.rows.size());
          resp.rows = std::move(scanned.rows);
          return api::Response{std::move(resp)};
        },
        [&](const api::EndTransactionRequest &) -> Res {
          return KvError::INVALID_ARGUMENT;
        },
        [&](const api::AdminSplitRequest &req) -> Res {
          return adminSplit(req);
        },
        [&](const api::AdminMergeRequest &req) -> Res {
          return adminMerge(req);
        },
        [&](const api::AdminTransferLeaseRequest &req) -> Res {
          return adminTransferLease(req);
        },
        [&](const api::AdminChangeReplicasRequest &req) -> Res {
          return adminChangeReplicas(req);
        },
        [&](const api::AdminRelocateRangeRequest &req) -> Res {
          return adminRelocateRange(req);
        });
  }

  bool LocalStore::storeExists(const api::ReplicationTarget &target) const {
    return target.store_id >= 1
       and static_cast<size_t>(target.store_id) <= config_.nodes
       and target.node_id == target.store_id;
  }

  outcome::result<api::Response> LocalStore::adminSplit(
      const api::AdminSplitRequest &req) {
    auto it = findRange(req.key);
    auto &range = it->second;
    if (api::keyEqual(req.split_key, range.desc.start_key)) {
      return api::Response{api::AdminSplitResponse{}};
    }
    if (not range.desc.containsKey(req.split_key)) {
      return KvError::INVALID_ARGUMENT;
    }

    Range right = range;
    right.desc.range_id = next_range_id_++;
    right.desc.start_key = req.split_key;
    ++right.desc.generation;
    range.desc.end_key = req.split_key;
    ++range.desc.generation;

    SL_DEBUG(logger_,
             "split r{} at {}, new range r{}",
             range.desc.range_id,
             api::prettyKey(req.split_key),
             right.desc.range_id);
    ranges_.emplace(req.split_key, std::move(right));
    return api::Response{api::AdminSplitResponse{}};
  }

  outcome::result<api::Response> LocalStore::adminMerge(
      const api::AdminMergeRequest &req) {
    auto it = findRange(req.key);
    auto next = std::next(it);
    if (next == ranges_.end()) {
      return KvError::INVALID_ARGUMENT;
    }
    auto stores_of = [](const api::RangeDescriptor &desc) {
      std::set<api::StoreId> stores;
      for (auto &replica : desc.replicas) {
        stores.insert(replica.store_id);
      }
      return stores;
    };
    if (stores_of(it->second.desc) != stores_of(next->second.desc)) {
      return KvError::INVALID_ARGUMENT;
    }

    auto &desc = it->second.desc;
    desc.end_key = next->second.desc.end_key;
    desc.generation =
        std::max(desc.generation, next->second.desc.generation) + 1;
    SL_DEBUG(logger_,
             "merged r{} into r{}",
             next->second.desc.range_id,
             desc.range_id);
    ranges_.erase(next);
    return api::Response{api::AdminMergeResponse{}};
  }

  outcome::result<api::Response> LocalStore::adminTransferLease(
      const api::AdminTransferLeaseRequest &req) {
    auto &range = findRange(req.key)->second;
    if (range.desc.findReplica(req.target) == nullptr) {
      return KvError::INVALID_LEASE_TARGET;
    }
    range.lease_holder = req.target;
    SL_DEBUG(logger_,
             "lease of r{} transferred to s{}",
             range.desc.range_id,
             req.target);
    return api::Response{api::AdminTransferLeaseResponse{}};
  }

  outcome::result<api::Response> LocalStore::adminChangeReplicas(
      const api::AdminChangeReplicasRequest &req) {
    auto &range = findRange(req.key)->second;
    if (not(range.desc == req.exp_desc)) {
      return KvError::RANGE_DESCRIPTOR_CHANGED;
    }

    auto desc = range.desc;
    for (auto &target : req.targets) {
      if (not storeExists(target)) {
        return KvError::INVALID_ARGUMENT;
      }
      auto existing = desc.findReplica(target.store_id);
      if (req.change_type == api::ReplicaChangeType::ADD_REPLICA) {
        if (existing != nullptr) {
          return KvError::INVALID_ARGUMENT;
        }
        desc.replicas.push_back({.node_id = target.node_id,
                                 .store_id = target.store_id,
                                 .replica_id = desc.next_replica_id++});
      } else {
        if (existing == nullptr or target.store_id == range.lease_holder) {
          return KvError::INVALID_ARGUMENT;
        }
        std::erase_if(desc.replicas, [&](const api::ReplicaDescriptor &r) {
          return r.store_id == target.store_id;
        });
      }
    }
    if (desc.replicas.empty()) {
      return KvError::INVALID_ARGUMENT;
    }
    ++desc.generation;
    range.desc = desc;

    SL_DEBUG(logger_, "replicas of range changed: {}", range.desc);
    return api::Response{api::AdminChangeReplicasResponse{.desc = desc}};
  }

  outcome::result<api::Response> LocalStore::adminRelocateRange(
      const api::AdminRelocateRangeRequest &req) {
    if (req.targets.empty()) {
      return KvError::INVALID_ARGUMENT;
    }
    std::set<api::StoreId> seen;
    for (auto &target : req.targets) {
      if (not storeExists(target) or not seen.insert(target.store_id).second) {
        return KvError::INVALID_ARGUMENT;
      }
    }

    auto &range = findRange(req.key)->second;
    auto &desc = range.desc;
    std::vector<api::ReplicaDescriptor> replicas;
    for (auto &target : req.targets) {
      if (auto existing = desc.findReplica(target.store_id)) {
        replicas.push_back(*existing);
      } else {
        replicas.push_back({.node_id = target.node_id,
                            .store_id = target.store_id,
                            .replica_id = desc.next_replica_id++});
      }
    }
    desc.replicas = std::move(replicas);
    ++desc.generation;
    if (not seen.contains(range.lease_holder)) {
      range.lease_holder = req.targets.front().store_id;
    }

    SL_DEBUG(logger_, "range relocated: {}", desc);
    return api::Response{api::AdminRelocateRangeResponse{}};
  }

}  // namespace shardkv::local
