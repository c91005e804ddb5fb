/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rocksdb/utilities/transaction.h>

#include "storage/rocksdb/rocksdb.hpp"

namespace kv::storage {

  /**
   * @brief Optimistic RocksDB transaction. Every key read through it is
   * tracked, commit fails with CONFLICT when one of them was written by
   * somebody else after the read.
   */
  class RocksDbTransaction : public SpacedTransaction {
   public:
    RocksDbTransaction(std::shared_ptr<RocksDb> rocks,
                       std::unique_ptr<rocksdb::Transaction> txn,
                       log::Logger logger);

    ~RocksDbTransaction() override;

    outcome::result<std::optional<ByteVec>> tryGet(
        std::string_view space, const ByteView &key) override;

    outcome::result<void> put(std::string_view space,
                              const ByteView &key,
                              ByteVecOrView &&value) override;

    outcome::result<void> remove(std::string_view space,
                                 const ByteView &key) override;

    outcome::result<void> commit() override;

    void rollback() override;

   private:
    std::shared_ptr<RocksDb> rocks_;
    std::unique_ptr<rocksdb::Transaction> txn_;
    log::Logger logger_;
    bool finished_ = false;
  };

}  // namespace kv::storage
