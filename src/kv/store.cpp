/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "kv/store.hpp"

#include "app/configuration.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "storage/rocksdb/rocksdb.hpp"
#include "storage/storage_error.hpp"

namespace kv {

  Store::Store(qtils::SharedRef<log::LoggingSystem> logsys,
               qtils::SharedRef<app::Configuration> config,
               qtils::SharedRef<storage::SpacedStorage> engine)
      : config_{std::move(config)},
        engine_{std::move(engine)},
        logger_{logsys->getLogger("Store", log::defaultGroupName)},
        bucket_logger_{logsys->getLogger("Bucket", log::defaultGroupName)} {}

  outcome::result<std::shared_ptr<Store>> Store::open(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::Configuration> config) {
    OUTCOME_TRY(rocks, storage::RocksDb::create(logsys, config));
    return std::make_shared<Store>(
        std::move(logsys), std::move(config), std::move(rocks));
  }

  std::shared_ptr<Store> Store::inMemory(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::Configuration> config) {
    return std::make_shared<Store>(
        std::move(logsys),
        std::move(config),
        std::make_shared<storage::InMemorySpacedStorage>());
  }

  outcome::result<std::vector<std::string>> Store::buckets() const {
    return engine_->spaceNames();
  }

  outcome::result<bool> Store::dropBucket(std::string_view name) {
    if (name.empty() or name == storage::kDefaultSpaceName) {
      SL_DEBUG(logger_, "Refused to drop bucket '{}'", name);
      return storage::StorageError::INVALID_ARGUMENT;
    }
    OUTCOME_TRY(dropped, engine_->dropSpace(name));
    if (dropped) {
      SL_DEBUG(logger_, "Bucket '{}' dropped", name);
    }
    return dropped;
  }

  outcome::result<void> Store::flush() {
    return engine_->flush();
  }

  outcome::result<std::shared_ptr<storage::BufferStorage>> Store::openSpace(
      const std::optional<std::string> &name) {
    if (name.has_value() and name->empty()) {
      return storage::StorageError::INVALID_ARGUMENT;
    }
    const auto space = storage::spaceName(name);
    OUTCOME_TRY(handle, engine_->getSpace(space));
    SL_TRACE(logger_, "Bucket '{}' opened", space);
    return handle;
  }

  size_t Store::maxRetries() const {
    return config_->transaction().max_retries;
  }

}  // namespace kv
