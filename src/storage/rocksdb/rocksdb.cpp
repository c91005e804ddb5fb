/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb.hpp"

#include <algorithm>
#include <limits>

#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <soralog/macro.hpp>

#include "app/configuration.hpp"
#include "storage/rocksdb/rocksdb_batch.hpp"
#include "storage/rocksdb/rocksdb_cursor.hpp"
#include "storage/rocksdb/rocksdb_transaction.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/spaces.hpp"
#include "storage/storage_error.hpp"
#include "utils/fd_limit.hpp"

namespace kv::storage {
  namespace fs = std::filesystem;

  namespace {
    rocksdb::ColumnFamilyOptions configureColumn(
        const app::Configuration::DatabaseConfig &config) {
      rocksdb::ColumnFamilyOptions options;
      options.OptimizeLevelStyleCompaction();
      options.compression = config.use_compression
                              ? rocksdb::kSnappyCompression
                              : rocksdb::kNoCompression;
      auto table_options =
          RocksDb::tableOptionsConfiguration(config.cache_size);
      options.table_factory.reset(NewBlockBasedTableFactory(table_options));
      return options;
    }
  }  // namespace

  RocksDb::RocksDb(Private,
                   qtils::SharedRef<log::LoggingSystem> logsys,
                   qtils::SharedRef<app::Configuration> app_config)
      : app_config_(std::move(app_config)),
        path_(app_config_->database().directory),
        read_only_(app_config_->database().read_only),
        temporary_(app_config_->database().temporary),
        column_options_(configureColumn(app_config_->database())),
        logger_(logsys->getLogger("RocksDB", "storage")) {}

  outcome::result<std::shared_ptr<RocksDb>> RocksDb::create(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::Configuration> app_config) {
    auto rocks = std::make_shared<RocksDb>(
        Private{}, std::move(logsys), std::move(app_config));
    OUTCOME_TRY(rocks->open());
    return rocks;
  }

  outcome::result<void> RocksDb::open() {
    auto options = rocksdb::Options{};
    options.create_if_missing = not read_only_;
    options.create_missing_column_families = not read_only_;

    // Setting limit for open rocksdb files to a half of system soft limit
    auto soft_limit = getFdLimit(logger_);
    if (not soft_limit) {
      SL_CRITICAL(logger_, "Call getrlimit(RLIMIT_NOFILE) was failed");
      return StorageError::UNKNOWN;
    }
    options.max_open_files = static_cast<int>(std::min<size_t>(
        soft_limit.value() / 2, std::numeric_limits<int>::max()));

    if (read_only_) {
      if (not fs::is_directory(path_)) {
        SL_ERROR(logger_,
                 "Can't open {} for database: is not a directory",
                 path_.native());
        return StorageError::DB_PATH_NOT_CREATED;
      }
    } else {
      std::error_code ec;
      fs::create_directories(path_, ec);
      if (ec) {
        SL_CRITICAL(logger_, "Can't create DB directory: {}", ec.message());
        return StorageError::DB_PATH_NOT_CREATED;
      }
      OUTCOME_TRY(createDirectory(path_, logger_));
    }

    std::vector<std::string> families;
    auto status =
        rocksdb::DB::ListColumnFamilies(options, path_.native(), &families);
    if (not status.ok() and not status.IsPathNotFound()
        and not status.IsIOError()) {
      SL_ERROR(logger_,
               "Can't list column families in {}: {}",
               path_.native(),
               status.ToString());
      return status_as_error(status, logger_);
    }
    // a database which does not exist yet has only the default family
    if (std::ranges::find(families, rocksdb::kDefaultColumnFamilyName)
        == families.end()) {
      families.emplace_back(rocksdb::kDefaultColumnFamilyName);
    }

    std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
    descriptors.reserve(families.size());
    for (auto &family : families) {
      descriptors.emplace_back(family, column_options_);
      SL_TRACE(logger_, "Column family '{}' found", family);
    }

    std::vector<rocksdb::ColumnFamilyHandle *> handles;
    if (read_only_) {
      status = rocksdb::DB::OpenForReadOnly(
          options, path_.native(), descriptors, &handles, &db_);
    } else {
      status = rocksdb::OptimisticTransactionDB::Open(
          options, path_.native(), descriptors, &handles, &txn_db_);
      db_ = txn_db_;
    }
    if (not status.ok()) {
      SL_ERROR(logger_,
               "Can't open database in {}: {}",
               path_.native(),
               status.ToString());
      return status_as_error(status, logger_);
    }

    for (auto *handle : handles) {
      columns_.emplace(handle->GetName(), own(handle));
    }

    SL_DEBUG(logger_,
             "Database opened in {} with {} spaces{}",
             path_.native(),
             columns_.size(),
             read_only_ ? " (read-only)" : "");
    return outcome::success();
  }

  RocksDb::~RocksDb() {
    if (db_ != nullptr) {
      // cursors and transactions keep the database alive, so these are the
      // last references
      spaces_.clear();
      columns_.clear();
      auto status = db_->Close();
      if (not status.ok()) {
        SL_ERROR(logger_, "Can't close database: {}", status.ToString());
      }
      delete db_;
      db_ = nullptr;
    }

    if (temporary_) {
      std::error_code ec;
      fs::remove_all(path_, ec);
      if (ec) {
        SL_WARN(logger_,
                "Can't remove temporary database {}: {}",
                path_.native(),
                ec.message());
      }
    }
  }

  outcome::result<void> RocksDb::createDirectory(
      const std::filesystem::path &absolute_path, log::Logger &log) {
    std::error_code ec;
    if (not fs::create_directory(absolute_path.native(), ec) and ec.value()) {
      SL_ERROR(log,
               "Can't create directory {} for database: {}",
               absolute_path.native(),
               ec.message());
      return StorageError::IO_ERROR;
    }
    if (not fs::is_directory(absolute_path.native())) {
      SL_ERROR(log,
               "Can't open {} for database: is not a directory",
               absolute_path.native());
      return StorageError::IO_ERROR;
    }
    return outcome::success();
  }

  RocksDb::ColumnFamilyHandlePtr RocksDb::own(
      rocksdb::ColumnFamilyHandle *handle) {
    return ColumnFamilyHandlePtr{
        handle, [db = db_, logger = logger_](rocksdb::ColumnFamilyHandle *h) {
          auto status = db->DestroyColumnFamilyHandle(h);
          if (not status.ok()) {
            SL_WARN(logger,
                    "Can't destroy column family handle: {}",
                    status.ToString());
          }
        }};
  }

  outcome::result<RocksDb::ColumnFamilyHandlePtr> RocksDb::column(
      std::string_view space) {
    std::lock_guard lock(columns_mutex_);
    if (auto it = columns_.find(space); it != columns_.end()) {
      return it->second;
    }
    if (read_only_) {
      return StorageError::NOT_FOUND;
    }
    rocksdb::ColumnFamilyHandle *created{};
    auto status =
        db_->CreateColumnFamily(column_options_, std::string(space), &created);
    if (not status.ok()) {
      SL_ERROR(logger_,
               "Can't create column family '{}': {}",
               space,
               status.ToString());
      return status_as_error(status, logger_);
    }
    SL_DEBUG(logger_, "Space '{}' created", space);
    auto handle = own(created);
    columns_.emplace(std::string(space), handle);
    return handle;
  }

  outcome::result<std::shared_ptr<BufferStorage>> RocksDb::getSpace(
      std::string_view space) {
    if (space.empty()) {
      return StorageError::INVALID_ARGUMENT;
    }
    // creates the column family ahead of the first write
    OUTCOME_TRY(column(space));
    std::lock_guard lock(columns_mutex_);
    if (auto it = spaces_.find(space); it != spaces_.end()) {
      return it->second;
    }
    auto space_ptr = std::make_shared<RocksDbSpace>(
        weak_from_this(), std::string(space), logger_);
    spaces_.emplace(std::string(space), space_ptr);
    return space_ptr;
  }

  outcome::result<std::vector<std::string>> RocksDb::spaceNames() const {
    std::lock_guard lock(columns_mutex_);
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto &[name, _] : columns_) {
      names.emplace_back(name);
    }
    return names;
  }

  outcome::result<bool> RocksDb::dropSpace(std::string_view space) {
    if (space.empty() or space == kDefaultSpaceName) {
      return StorageError::INVALID_ARGUMENT;
    }
    if (read_only_) {
      return StorageError::NOT_SUPPORTED;
    }
    std::lock_guard lock(columns_mutex_);
    auto it = columns_.find(space);
    if (it == columns_.end()) {
      return false;
    }
    auto status = db_->DropColumnFamily(it->second.get());
    if (not status.ok()) {
      SL_ERROR(logger_,
               "Can't drop column family '{}': {}",
               space,
               status.ToString());
      return status_as_error(status, logger_);
    }
    // the handle itself goes away with its last cursor or transaction
    columns_.erase(it);
    SL_DEBUG(logger_, "Space '{}' dropped", space);
    return true;
  }

  outcome::result<std::unique_ptr<SpacedTransaction>>
  RocksDb::beginTransaction() {
    if (txn_db_ == nullptr) {
      return StorageError::NOT_SUPPORTED;
    }
    std::unique_ptr<rocksdb::Transaction> txn(
        txn_db_->BeginTransaction(wo_, rocksdb::OptimisticTransactionOptions{}));
    return std::make_unique<RocksDbTransaction>(
        shared_from_this(), std::move(txn), logger_);
  }

  outcome::result<void> RocksDb::flush() {
    if (read_only_) {
      return outcome::success();
    }
    std::vector<ColumnFamilyHandlePtr> owned;
    {
      std::lock_guard lock(columns_mutex_);
      for (auto &[_, handle] : columns_) {
        owned.push_back(handle);
      }
    }
    std::vector<rocksdb::ColumnFamilyHandle *> handles;
    handles.reserve(owned.size());
    for (auto &handle : owned) {
      handles.push_back(handle.get());
    }
    auto status = db_->Flush(rocksdb::FlushOptions{}, handles);
    if (not status.ok()) {
      SL_ERROR(logger_, "Can't flush database: {}", status.ToString());
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  template <typename F>
  auto RocksDb::atomically(F &&f)
      -> decltype(f(std::declval<rocksdb::Transaction &>())) {
    if (txn_db_ == nullptr) {
      return StorageError::NOT_SUPPORTED;
    }
    for (size_t attempt = 0; attempt < kMaxAtomicAttempts; ++attempt) {
      std::unique_ptr<rocksdb::Transaction> txn(txn_db_->BeginTransaction(
          wo_, rocksdb::OptimisticTransactionOptions{}));
      auto res = f(*txn);
      if (res.has_error()) {
        auto status = txn->Rollback();
        if (not status.ok()) {
          SL_WARN(logger_, "Can't rollback: {}", status.ToString());
        }
        return res.error();
      }
      auto status = txn->Commit();
      if (status.ok()) {
        return res;
      }
      if (not status.IsBusy() and not status.IsTryAgain()) {
        return status_as_error(status, logger_);
      }
      SL_TRACE(logger_, "Atomic update conflicted, attempt {}", attempt + 1);
    }
    SL_WARN(logger_,
            "Atomic update conflicted {} times in a row",
            kMaxAtomicAttempts);
    return StorageError::CONFLICT;
  }

  rocksdb::BlockBasedTableOptions RocksDb::tableOptionsConfiguration(
      uint64_t lru_cache_size, uint32_t block_size_kib) {
    rocksdb::BlockBasedTableOptions table_options;
    table_options.format_version = 5;
    table_options.block_cache = rocksdb::NewLRUCache(lru_cache_size);
    table_options.block_size = static_cast<size_t>(block_size_kib * 1024);
    table_options.cache_index_and_filter_blocks = true;
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(10, false));
    return table_options;
  }

  RocksDbSpace::RocksDbSpace(std::weak_ptr<RocksDb> storage,
                             std::string name,
                             log::Logger logger)
      : storage_{std::move(storage)},
        name_{std::move(name)},
        logger_{std::move(logger)} {}

  std::unique_ptr<BufferBatch> RocksDbSpace::batch() {
    return std::make_unique<RocksDbBatch>(storage_, name_, logger_);
  }

  outcome::result<std::unique_ptr<RocksDbSpace::Cursor>>
  RocksDbSpace::cursor() {
    OUTCOME_TRY(used, use());
    auto &[rocks, column] = used;
    // an implicit snapshot pins the view for the lifetime of the iterator
    auto it = std::unique_ptr<rocksdb::Iterator>(
        rocks->db_->NewIterator(rocks->ro_, column.get()));
    return std::make_unique<RocksDBCursor>(
        std::move(rocks), std::move(column), std::move(it), logger_);
  }

  outcome::result<bool> RocksDbSpace::contains(const ByteView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    return value.has_value();
  }

  outcome::result<std::optional<ByteVec>> RocksDbSpace::tryGet(
      const ByteView &key) const {
    auto used = use();
    if (used.has_error()) {
      // a space which was never created has no keys
      if (used.error() == StorageError::NOT_FOUND) {
        return std::nullopt;
      }
      return used.error();
    }
    auto &[rocks, column] = used.value();
    std::string value;
    auto status = rocks->db_->Get(
        rocks->ro_, column.get(), make_slice(key), &value);
    if (status.ok()) {
      return make_buffer(value);
    }

    if (status.IsNotFound()) {
      return std::nullopt;
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::put(const ByteView &key,
                                          ByteVecOrView &&value) {
    OUTCOME_TRY(used, use());
    auto &[rocks, column] = used;
    auto status =
        rocks->db_->Put(
        rocks->wo_, column.get(), make_slice(key), make_slice(value));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::remove(const ByteView &key) {
    OUTCOME_TRY(used, use());
    auto &[rocks, column] = used;
    auto status =
        rocks->db_->Delete(rocks->wo_, column.get(), make_slice(key));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<std::optional<ByteVec>> RocksDbSpace::exchange(
      const ByteView &key, const std::optional<ByteView> &value) {
    OUTCOME_TRY(used, use());
    auto rocks = used.rocks;
    auto *column = used.column.get();
    return rocks->atomically(
        [&](rocksdb::Transaction &txn)
            -> outcome::result<std::optional<ByteVec>> {
          std::string previous;
          auto status =
              txn.GetForUpdate(rocks->ro_, column, make_slice(key), &previous);
          if (not status.ok() and not status.IsNotFound()) {
            return status_as_error(status, logger_);
          }
          const bool found = status.ok();
          status = value.has_value()
                     ? txn.Put(column, make_slice(key), make_slice(*value))
                     : txn.Delete(column, make_slice(key));
          if (not status.ok()) {
            return status_as_error(status, logger_);
          }
          if (not found) {
            return std::nullopt;
          }
          return make_buffer(previous);
        });
  }

  outcome::result<bool> RocksDbSpace::compareAndSwap(
      const ByteView &key,
      const std::optional<ByteView> &expected,
      const std::optional<ByteView> &proposed) {
    OUTCOME_TRY(used, use());
    auto rocks = used.rocks;
    auto *column = used.column.get();
    return rocks->atomically(
        [&](rocksdb::Transaction &txn)
            -> outcome::result<bool> {
          std::string current;
          auto status =
              txn.GetForUpdate(rocks->ro_, column, make_slice(key), &current);
          if (not status.ok() and not status.IsNotFound()) {
            return status_as_error(status, logger_);
          }
          const bool found = status.ok();
          const bool matches =
              expected.has_value() ? found and equal_bytes(current, *expected)
                                   : not found;
          if (not matches) {
            return false;
          }
          status = proposed.has_value()
                     ? txn.Put(column, make_slice(key), make_slice(*proposed))
                     : txn.Delete(column, make_slice(key));
          if (not status.ok()) {
            return status_as_error(status, logger_);
          }
          return true;
        });
  }

  outcome::result<RocksDbSpace::Use> RocksDbSpace::use() const {
    auto rocks = storage_.lock();
    if (!rocks) {
      return StorageError::STORAGE_GONE;
    }
    OUTCOME_TRY(column, rocks->column(name_));
    return Use{.rocks = std::move(rocks), .column = column};
  }

}  // namespace kv::storage
