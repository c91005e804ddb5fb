/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <utility>

#include <qtils/shared_ref.hpp>
#include <rocksdb/db.h>
#include <rocksdb/table.h>
#include <rocksdb/utilities/optimistic_transaction_db.h>

#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"
#include "storage/spaced_storage.hpp"
#include "utils/ctor_limiters.hpp"

namespace kv::app {
  class Configuration;
}

namespace kv::storage {

  /**
   * @brief RocksDB engine. Every space is a column family, created when
   * first requested. Writes which must observe the current value go
   * through optimistic transactions.
   */
  class RocksDb : public SpacedStorage,
                  public std::enable_shared_from_this<RocksDb>,
                  NonCopyable,
                  NonMovable {
    struct Private {
      explicit Private() = default;
    };

   public:
    /// Destroyed with its last user, which may outlive a drop of the space
    using ColumnFamilyHandlePtr = std::shared_ptr<rocksdb::ColumnFamilyHandle>;

    /// Use create()
    RocksDb(Private,
            qtils::SharedRef<log::LoggingSystem> logsys,
            qtils::SharedRef<app::Configuration> app_config);

    ~RocksDb() override;

    static constexpr uint32_t kDefaultBlockSizeKiB = 32;
    /// Attempts of a single-key read-modify-write before giving up
    static constexpr size_t kMaxAtomicAttempts = 64;

    /**
     * Open (or create) the database described by the configuration
     */
    static outcome::result<std::shared_ptr<RocksDb>> create(
        qtils::SharedRef<log::LoggingSystem> logsys,
        qtils::SharedRef<app::Configuration> app_config);

    outcome::result<std::shared_ptr<BufferStorage>> getSpace(
        std::string_view space) override;

    outcome::result<std::vector<std::string>> spaceNames() const override;

    outcome::result<bool> dropSpace(std::string_view space) override;

    outcome::result<std::unique_ptr<SpacedTransaction>> beginTransaction()
        override;

    outcome::result<void> flush() override;

    /**
     * Prepare configuration structure
     * @param lru_cache_size - LRU rocksdb cache in bytes
     * @param block_size_kib - internal rocksdb block size in KiB
     * @return options structure
     */
    static rocksdb::BlockBasedTableOptions tableOptionsConfiguration(
        uint64_t lru_cache_size,
        uint32_t block_size_kib = kDefaultBlockSizeKiB);

    friend class RocksDbSpace;
    friend class RocksDbBatch;
    friend class RocksDbTransaction;

   private:
    static outcome::result<void> createDirectory(
        const std::filesystem::path &absolute_path, log::Logger &log);

    outcome::result<void> open();

    ColumnFamilyHandlePtr own(rocksdb::ColumnFamilyHandle *handle);

    /// Column family of the space, created if missing
    outcome::result<ColumnFamilyHandlePtr> column(std::string_view space);

    /// Runs f in an optimistic transaction until it commits without conflict
    template <typename F>
    auto atomically(F &&f)
        -> decltype(f(std::declval<rocksdb::Transaction &>()));

    qtils::SharedRef<app::Configuration> app_config_;
    std::filesystem::path path_;
    bool read_only_ = false;
    bool temporary_ = false;

    rocksdb::DB *db_{};
    // null in read-only mode
    rocksdb::OptimisticTransactionDB *txn_db_{};

    rocksdb::ColumnFamilyOptions column_options_;

    mutable std::mutex columns_mutex_;
    std::map<std::string, ColumnFamilyHandlePtr, std::less<>> columns_;
    std::map<std::string, std::shared_ptr<BufferStorage>, std::less<>>
        spaces_;

    rocksdb::ReadOptions ro_;
    rocksdb::WriteOptions wo_;
    log::Logger logger_;
  };

  class RocksDbSpace : public BufferStorage {
   public:
    ~RocksDbSpace() override = default;

    RocksDbSpace(std::weak_ptr<RocksDb> storage,
                 std::string name,
                 log::Logger logger);

    std::unique_ptr<BufferBatch> batch() override;

    outcome::result<std::unique_ptr<Cursor>> cursor() override;

    outcome::result<bool> contains(const ByteView &key) const override;

    outcome::result<std::optional<ByteVec>> tryGet(
        const ByteView &key) const override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    outcome::result<void> remove(const ByteView &key) override;

    outcome::result<std::optional<ByteVec>> exchange(
        const ByteView &key, const std::optional<ByteView> &value) override;

    outcome::result<bool> compareAndSwap(
        const ByteView &key,
        const std::optional<ByteView> &expected,
        const std::optional<ByteView> &proposed) override;

    const std::string &name() const {
      return name_;
    }

   private:
    struct Use {
      std::shared_ptr<RocksDb> rocks;
      RocksDb::ColumnFamilyHandlePtr column;
    };

    // gather storage instance from weak ptr and resolve the column family
    outcome::result<Use> use() const;

    std::weak_ptr<RocksDb> storage_;
    std::string name_;
    log::Logger logger_;
  };
}  // namespace kv::storage
