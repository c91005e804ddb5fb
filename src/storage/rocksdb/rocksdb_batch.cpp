/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_batch.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"

namespace kv::storage {

  RocksDbBatch::RocksDbBatch(std::weak_ptr<RocksDb> storage,
                             std::string space,
                             log::Logger logger)
      : storage_(std::move(storage)),
        space_(std::move(space)),
        logger_(std::move(logger)) {}

  outcome::result<void> RocksDbBatch::put(const ByteView &key,
                                          ByteVecOrView &&value) {
    OUTCOME_TRY(rocks, use());
    OUTCOME_TRY(column, rocks->column(space_));
    auto status =
        batch_.Put(column.get(), make_slice(key), make_slice(value));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbBatch::remove(const ByteView &key) {
    OUTCOME_TRY(rocks, use());
    OUTCOME_TRY(column, rocks->column(space_));
    auto status = batch_.Delete(column.get(), make_slice(key));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbBatch::commit() {
    OUTCOME_TRY(rocks, use());
    auto status = rocks->db_->Write(rocks->wo_, &batch_);
    if (status.ok()) {
      SL_TRACE(logger_,
               "Batch of {} operations applied to '{}'",
               batch_.Count(),
               space_);
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  void RocksDbBatch::clear() {
    batch_.Clear();
  }

  size_t RocksDbBatch::size() const {
    return batch_.Count();
  }

  outcome::result<std::shared_ptr<RocksDb>> RocksDbBatch::use() const {
    auto rocks = storage_.lock();
    if (!rocks) {
      return StorageError::STORAGE_GONE;
    }
    return rocks;
  }
}  // namespace kv::storage
