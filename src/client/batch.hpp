/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>
#include <system_error>
#include <vector>

#include <qtils/outcome.hpp>

#include "api/batch.hpp"
#include "client/key_value.hpp"

namespace shardkv::client {

  /**
   * Builder of a group of operations sent in one round trip. Every builder
   * call appends exactly one Result, so `results[i]` belongs to the i-th
   * call. A call whose arguments fail to encode keeps the error in its
   * Result and prevents the batch from being sent.
   *
   * A batch is run once, by DB::run or Txn::run.
   */
  class Batch {
   public:
    using SendFn = std::function<outcome::result<api::BatchResponse>(
        api::BatchRequest)>;

    api::Header header;
    std::vector<Result> results;

    template <api::KeyLike K>
    void get(const K &key) {
      appendReq(api::GetRequest{.key = api::toKey(key)}, 1);
    }

    template <api::KeyLike K, typename V>
    void put(const K &key, const V &value) {
      putImpl(key, value, false);
    }

    /// Puts a non-versioned value
    template <api::KeyLike K, typename V>
    void putInline(const K &key, const V &value) {
      putImpl(key, value, true);
    }

    /**
     * Puts `value` only if the current value equals `exp_value`; pass
     * std::nullopt to require that the key does not exist
     */
    template <api::KeyLike K, typename V, typename E>
    void cPut(const K &key, const V &value, const E &exp_value) {
      auto value_res = api::encodeValue(value);
      if (value_res.has_error()) {
        initResult(0, 0, false, value_res.error());
        return;
      }
      std::optional<api::Value> exp;
      if constexpr (not std::is_same_v<E, std::nullopt_t>) {
        auto exp_res = api::encodeValue(exp_value);
        if (exp_res.has_error()) {
          initResult(0, 0, false, exp_res.error());
          return;
        }
        exp = std::move(exp_res.value());
      }
      appendReq(api::ConditionalPutRequest{.key = api::toKey(key),
                                           .value = std::move(value_res.value()),
                                           .exp_value = std::move(exp)},
                1);
    }

    /// Puts `value` only if the key is absent or already holds `value`
    template <api::KeyLike K, typename V>
    void initPut(const K &key, const V &value, bool fail_on_tombstones) {
      auto value_res = api::encodeValue(value);
      if (value_res.has_error()) {
        initResult(0, 0, false, value_res.error());
        return;
      }
      appendReq(
          api::InitPutRequest{.key = api::toKey(key),
                              .value = std::move(value_res.value()),
                              .fail_on_tombstones = fail_on_tombstones},
          1);
    }

    /// Adds `value` to the integer stored at `key`, absent counts as 0
    template <api::KeyLike K>
    void inc(const K &key, int64_t value) {
      appendReq(
          api::IncrementRequest{.key = api::toKey(key), .increment = value},
          1);
    }

    /// Rows of [start, end) in ascending key order
    template <api::KeyLike S, api::KeyLike E>
    void scan(const S &start, const E &end) {
      appendReq(api::ScanRequest{.span = {api::toKey(start), api::toKey(end)}},
                0);
    }

    /// Rows of [start, end) in descending key order
    template <api::KeyLike S, api::KeyLike E>
    void reverseScan(const S &start, const E &end) {
      appendReq(
          api::ReverseScanRequest{.span = {api::toKey(start), api::toKey(end)}},
          0);
    }

    /// Deletes every key; one Result with one row per key
    template <api::KeyLike... K>
    void del(const K &...keys) {
      (reqs_.emplace_back(api::DeleteRequest{.key = api::toKey(keys)}), ...);
      initResult(sizeof...(K), sizeof...(K), false, {});
    }

    void del(const std::vector<api::Key> &keys);

    /// Deletes [start, end); deleted keys are reported if `return_keys`
    template <api::KeyLike S, api::KeyLike E>
    void delRange(const S &start, const E &end, bool return_keys) {
      appendReq(api::DeleteRangeRequest{.span = {api::toKey(start),
                                                 api::toKey(end)},
                                        .return_keys = return_keys},
                0);
    }

    /**
     * Appends a request as is. Results of raw requests are filled too, but
     * the intended way to read them is rawResponse(). Raw and regular
     * calls cannot be mixed in one batch.
     */
    void addRawRequest(api::Request request);

    void adminSplit(const api::Key &span_key, const api::Key &split_key);
    void adminMerge(const api::Key &key);
    void adminTransferLease(const api::Key &key, api::StoreId target);
    void adminChangeReplicas(const api::Key &key,
                             api::ReplicaChangeType change_type,
                             std::vector<api::ReplicationTarget> targets,
                             api::RangeDescriptor exp_desc);
    void adminRelocateRange(const api::Key &key,
                            std::vector<api::ReplicationTarget> targets);

    /// Wire response of the run, if there was one
    [[nodiscard]] const std::optional<api::BatchResponse> &rawResponse() const {
      return response_;
    }

    [[nodiscard]] const std::vector<api::Request> &requests() const {
      return reqs_;
    }

    /**
     * Checks the batch can be sent: it was not run before and every call
     * encoded fine. On a construction error the other calls get
     * ClientError::BATCH_NOT_SENT.
     */
    outcome::result<void> prepare();

    /**
     * Sends the batch through `send` and fills results
     * @return first per-call error, or the error of the exchange
     */
    outcome::result<void> sendAndFill(const SendFn &send);

    /// First error among the results
    [[nodiscard]] std::error_code resultErr() const;

   private:
    friend class Txn;

    /// Appends EndTransaction in the raw mode of the batch
    void appendEndTransaction(bool commit);

    template <api::KeyLike K, typename V>
    void putImpl(const K &key, const V &value, bool inline_value) {
      auto value_res = api::encodeValue(value);
      if (value_res.has_error()) {
        initResult(0, 0, false, value_res.error());
        return;
      }
      appendReq(api::PutRequest{.key = api::toKey(key),
                                .value = std::move(value_res.value()),
                                .inline_value = inline_value},
                1);
    }

    void appendReq(api::Request request, size_t num_rows);
    void initResult(size_t calls,
                    size_t num_rows,
                    bool raw,
                    std::error_code err);
    void fillResults();
    void fillCall(Result &result,
                  size_t k,
                  const api::Request &request,
                  const api::Response *reply);

    std::vector<api::Request> reqs_;
    std::optional<api::BatchResponse> response_;
    std::error_code batch_err_;
    std::optional<bool> raw_;
    bool used_ = false;
  };

  /// Error of the only call of a batch, or the run error
  outcome::result<void> getOneErr(const outcome::result<void> &run_res,
                                  const Batch &b);

  /// The only Result of a batch
  outcome::result<Result> getOneResult(const outcome::result<void> &run_res,
                                       const Batch &b);

  /// The only row of the only Result of a batch
  outcome::result<KeyValue> getOneRow(const outcome::result<void> &run_res,
                                      const Batch &b);

}  // namespace shardkv::client
