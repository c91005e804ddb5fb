/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "kv/transaction.hpp"

namespace kv {

  Transaction::Transaction(std::unique_ptr<storage::SpacedTransaction> txn,
                           log::Logger logger)
      : txn_{std::move(txn)}, logger_{std::move(logger)} {}

  Transaction::~Transaction() {
    if (state_ != State::Committed) {
      txn_->rollback();
    }
  }

  std::error_code Transaction::abort(std::error_code reason) {
    if (state_ == State::Running) {
      state_ = State::Aborted;
      abort_reason_ = reason;
      txn_->rollback();
      SL_DEBUG(logger_, "Transaction aborted: {}", reason.message());
    }
    return abort_reason_.value_or(reason);
  }

  std::error_code Transaction::abort() {
    return abort(TransactionError::ABORTED);
  }

  outcome::result<void> Transaction::ensureRunning() const {
    if (state_ != State::Running) {
      return TransactionError::NOT_RUNNING;
    }
    return outcome::success();
  }

  outcome::result<bool> Transaction::complete(
      const std::optional<std::error_code> &body_error) {
    if (state_ == State::Aborted) {
      return abort_reason_.value_or(make_error_code(TransactionError::ABORTED));
    }
    if (state_ != State::Running) {
      return TransactionError::NOT_RUNNING;
    }

    if (body_error.has_value()) {
      txn_->rollback();
      if (isConflict(*body_error)) {
        state_ = State::ConflictRetry;
        return false;
      }
      state_ = State::Aborted;
      return *body_error;
    }

    auto committed = txn_->commit();
    if (committed.has_value()) {
      state_ = State::Committed;
      return true;
    }
    if (isConflict(committed.error())) {
      state_ = State::ConflictRetry;
      return false;
    }
    state_ = State::Aborted;
    return committed.error();
  }

}  // namespace kv
