/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rocksdb/write_batch.h>

#include "storage/rocksdb/rocksdb.hpp"

namespace kv::storage {

  class RocksDbBatch : public BufferBatch {
   public:
    ~RocksDbBatch() override = default;

    RocksDbBatch(std::weak_ptr<RocksDb> storage,
                 std::string space,
                 log::Logger logger);

    outcome::result<void> commit() override;

    void clear() override;

    size_t size() const override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    outcome::result<void> remove(const ByteView &key) override;

   private:
    outcome::result<std::shared_ptr<RocksDb>> use() const;

    std::weak_ptr<RocksDb> storage_;
    std::string space_;
    log::Logger logger_;
    rocksdb::WriteBatch batch_;
  };
}  // namespace kv::storage
