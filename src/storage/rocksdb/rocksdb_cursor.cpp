/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_cursor.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"

namespace kv::storage {

  RocksDBCursor::RocksDBCursor(std::shared_ptr<RocksDb> rocks,
                               RocksDb::ColumnFamilyHandlePtr column,
                               std::unique_ptr<rocksdb::Iterator> it,
                               log::Logger logger)
      : rocks_{std::move(rocks)},
        column_{std::move(column)},
        i_{std::move(it)},
        logger_{std::move(logger)} {}

  outcome::result<bool> RocksDBCursor::seekFirst() {
    i_->SeekToFirst();
    return checkedValid();
  }

  outcome::result<bool> RocksDBCursor::seek(const ByteView &key) {
    i_->Seek(make_slice(key));
    return checkedValid();
  }

  outcome::result<bool> RocksDBCursor::seekLast() {
    i_->SeekToLast();
    return checkedValid();
  }

  bool RocksDBCursor::isValid() const {
    return i_->Valid();
  }

  outcome::result<void> RocksDBCursor::next() {
    i_->Next();
    OUTCOME_TRY(checkedValid());
    return outcome::success();
  }

  outcome::result<void> RocksDBCursor::prev() {
    i_->Prev();
    OUTCOME_TRY(checkedValid());
    return outcome::success();
  }

  std::optional<ByteVec> RocksDBCursor::key() const {
    return isValid() ? std::make_optional(make_buffer(i_->key()))
                     : std::nullopt;
  }

  std::optional<ByteVec> RocksDBCursor::value() const {
    return isValid() ? std::make_optional(make_buffer(i_->value()))
                     : std::nullopt;
  }

  outcome::result<bool> RocksDBCursor::checkedValid() const {
    if (i_->Valid()) {
      return true;
    }
    auto status = i_->status();
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return false;
  }
}  // namespace kv::storage
