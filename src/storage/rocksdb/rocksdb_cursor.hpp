/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rocksdb/iterator.h>

#include "storage/rocksdb/rocksdb.hpp"

namespace kv::storage {

  /**
   * Iterator over one column family. Keeps the database and the column
   * alive, so it may outlive the store and buckets which created it.
   */
  class RocksDBCursor : public BufferStorageCursor {
   public:
    ~RocksDBCursor() override = default;

    RocksDBCursor(std::shared_ptr<RocksDb> rocks,
                  RocksDb::ColumnFamilyHandlePtr column,
                  std::unique_ptr<rocksdb::Iterator> it,
                  log::Logger logger);

    outcome::result<bool> seekFirst() override;

    outcome::result<bool> seek(const ByteView &key) override;

    outcome::result<bool> seekLast() override;

    bool isValid() const override;

    outcome::result<void> next() override;

    outcome::result<void> prev() override;

    std::optional<ByteVec> key() const override;

    std::optional<ByteVec> value() const override;

   private:
    /// Iterator becomes invalid both at the end and on a failure
    outcome::result<bool> checkedValid() const;

    // destroyed bottom-up: the iterator goes before its column and database
    std::shared_ptr<RocksDb> rocks_;
    RocksDb::ColumnFamilyHandlePtr column_;
    std::unique_ptr<rocksdb::Iterator> i_;
    log::Logger logger_;
  };

}  // namespace kv::storage
