/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/client_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(shardkv::client, ClientError, e) {
  using E = shardkv::client::ClientError;
  switch (e) {
    case E::TERMINATED_RETRYABLE_ERROR:
      return "terminated retryable error";
    case E::MISSING_RESPONSE:
      return "No response for request";
    case E::UNEXPECTED_RESPONSE_TYPE:
      return "Response does not match request";
    case E::BATCH_ALREADY_USED:
      return "Batch was already run";
    case E::BATCH_NOT_SENT:
      return "Batch was not sent because of a construction error";
    case E::MIXED_RAW_REQUESTS:
      return "Batch mixes raw and regular requests";
    case E::STOPPER_STOPPED:
      return "Stopper is stopped, no new tasks accepted";
  }
  return "Unknown client::ClientError";
}
