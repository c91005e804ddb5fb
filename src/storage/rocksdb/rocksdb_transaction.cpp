/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_transaction.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"

namespace kv::storage {

  RocksDbTransaction::RocksDbTransaction(
      std::shared_ptr<RocksDb> rocks,
      std::unique_ptr<rocksdb::Transaction> txn,
      log::Logger logger)
      : rocks_(std::move(rocks)),
        txn_(std::move(txn)),
        logger_(std::move(logger)) {}

  RocksDbTransaction::~RocksDbTransaction() {
    rollback();
  }

  outcome::result<std::optional<ByteVec>> RocksDbTransaction::tryGet(
      std::string_view space, const ByteView &key) {
    if (finished_) {
      return StorageError::INVALID_ARGUMENT;
    }
    OUTCOME_TRY(column, rocks_->column(space));
    std::string value;
    auto status = txn_->GetForUpdate(
        rocks_->ro_, column.get(), make_slice(key), &value);
    if (status.ok()) {
      return make_buffer(value);
    }
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbTransaction::put(std::string_view space,
                                                const ByteView &key,
                                                ByteVecOrView &&value) {
    if (finished_) {
      return StorageError::INVALID_ARGUMENT;
    }
    OUTCOME_TRY(column, rocks_->column(space));
    auto status =
        txn_->Put(column.get(), make_slice(key), make_slice(value));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbTransaction::remove(std::string_view space,
                                                   const ByteView &key) {
    if (finished_) {
      return StorageError::INVALID_ARGUMENT;
    }
    OUTCOME_TRY(column, rocks_->column(space));
    auto status = txn_->Delete(column.get(), make_slice(key));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbTransaction::commit() {
    if (finished_) {
      return StorageError::INVALID_ARGUMENT;
    }
    finished_ = true;
    auto status = txn_->Commit();
    if (status.ok()) {
      return outcome::success();
    }
    return status_as_error(status, logger_);
  }

  void RocksDbTransaction::rollback() {
    if (finished_) {
      return;
    }
    finished_ = true;
    auto status = txn_->Rollback();
    if (not status.ok()) {
      SL_WARN(logger_, "Can't rollback transaction: {}", status.ToString());
    }
  }

}  // namespace kv::storage
