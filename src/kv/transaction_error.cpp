/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "kv/transaction_error.hpp"

#include "storage/storage_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(kv, TransactionError, e) {
  using E = kv::TransactionError;
  switch (e) {
    case E::CONFLICT:
      return "Transaction conflicts with a concurrent modification";
    case E::RETRIES_EXHAUSTED:
      return "Transaction kept conflicting, retries exhausted";
    case E::ABORTED:
      return "Transaction aborted";
    case E::NOT_RUNNING:
      return "Transaction is not running";
  }
  return "Unknown TransactionError";
}

namespace kv {

  bool isConflict(const std::error_code &ec) {
    return ec == TransactionError::CONFLICT
        or ec == storage::StorageError::CONFLICT;
  }

}  // namespace kv
