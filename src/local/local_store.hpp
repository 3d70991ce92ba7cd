/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include <qtils/shared_ref.hpp>

#include "api/batch.hpp"
#include "clock/hybrid_clock.hpp"
#include "log/logger.hpp"
#include "utils/ctor_limiters.hpp"

namespace shardkv::local {

  /// Buffered writes of a batch or transaction; nullopt marks a deletion
  using WriteBuffer =
      std::map<api::Key, std::optional<api::Value>, api::KeyLess>;

  /**
   * Pending state of one optimistic transaction. Reads are valid as long
   * as nothing they observed changed after `read_seq`.
   */
  struct TxnState {
    WriteBuffer writes;
    std::set<api::Key, api::KeyLess> read_keys;
    std::vector<api::Span> read_spans;
    uint64_t read_seq = 0;
  };

  struct StoreConfig {
    size_t nodes = 3;
    size_t replication_factor = 3;
    // initial range boundaries
    std::vector<api::Key> split_keys;
  };

  /**
   * In-process key-value store partitioned into ranges. Node `i` owns
   * store `i`. Batches are evaluated atomically: either all their writes
   * are applied or none.
   */
  class LocalStore : NonCopyable, NonMovable {
   public:
    LocalStore(qtils::SharedRef<log::LoggingSystem> logsys,
               qtils::SharedRef<clock::HybridClock> clock,
               StoreConfig config);

    /**
     * Evaluates `ba`. Outside of a transaction (`txn` is null) a consistent
     * batch with writes must stay within one range, otherwise
     * KvError::OP_REQUIRES_TXN is returned. A failed batch leaves both data
     * and range layout untouched. Inside a transaction writes go
     * to `txn` and become visible on commit.
     */
    outcome::result<api::BatchResponse> evaluate(const api::BatchRequest &ba,
                                                 TxnState *txn);

    /// Sequence number of the last applied write
    [[nodiscard]] uint64_t currentSeq() const;

    [[nodiscard]] std::vector<api::RangeDescriptor> ranges() const;

    [[nodiscard]] api::RangeDescriptor rangeFor(const api::Key &key) const;

    [[nodiscard]] api::StoreId leaseHolder(const api::Key &key) const;

    [[nodiscard]] std::vector<api::ReplicationTarget> stores() const;

   private:
    struct Entry {
      // nullopt is a tombstone
      std::optional<api::Value> value;
      uint64_t mod_seq = 0;
    };

    struct Range {
      api::RangeDescriptor desc;
      api::StoreId lease_holder = 0;
    };

    using Data = std::map<api::Key, Entry, api::KeyLess>;
    using Ranges = std::map<api::Key, Range, api::KeyLess>;

    struct Evaluation;

    Ranges::iterator findRange(const api::Key &key);
    Ranges::const_iterator findRange(const api::Key &key) const;
    size_t rangesTouched(const api::BatchRequest &ba) const;

    outcome::result<api::Response> evaluateRequest(Evaluation &eval,
                                                   const api::Request &request);

    outcome::result<std::optional<api::Value>> read(Evaluation &eval,
                                                    const api::Key &key);
    bool hasTombstone(Evaluation &eval, const api::Key &key) const;

    struct ScanOutcome {
      std::vector<api::KeyValuePair> rows;
      std::optional<api::Span> resume_span;
    };
    outcome::result<ScanOutcome> scan(Evaluation &eval,
                                      const api::Span &span,
                                      bool reverse);

    outcome::result<void> validate(const TxnState &txn) const;
    void apply(const WriteBuffer &writes);

    outcome::result<api::Response> adminSplit(
        const api::AdminSplitRequest &req);
    outcome::result<api::Response> adminMerge(
        const api::AdminMergeRequest &req);
    outcome::result<api::Response> adminTransferLease(
        const api::AdminTransferLeaseRequest &req);
    outcome::result<api::Response> adminChangeReplicas(
        const api::AdminChangeReplicasRequest &req);
    outcome::result<api::Response> adminRelocateRange(
        const api::AdminRelocateRangeRequest &req);

    bool storeExists(const api::ReplicationTarget &target) const;

    log::Logger logger_;
    qtils::SharedRef<clock::HybridClock> clock_;
    StoreConfig config_;

    mutable std::mutex mutex_;
    Data data_;
    Ranges ranges_;
    uint64_t seq_ = 0;
    api::RangeId next_range_id_ = 1;
  };

}  // namespace shardkv::local
