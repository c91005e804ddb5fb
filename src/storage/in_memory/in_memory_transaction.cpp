/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_transaction.hpp"

#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/storage_error.hpp"

namespace kv::storage {

  InMemoryTransaction::InMemoryTransaction(
      std::shared_ptr<InMemorySpacedStorage> engine)
      : engine_{std::move(engine)} {}

  outcome::result<std::optional<ByteVec>> InMemoryTransaction::tryGet(
      std::string_view space, const ByteView &key) {
    if (finished_) {
      return StorageError::INVALID_ARGUMENT;
    }
    Key k{std::string(space), toByteVec(key)};
    if (auto it = writes_.find(k); it != writes_.end()) {
      return it->second;
    }
    std::lock_guard lock(engine_->mutex_);
    observeLocked(k);
    return engine_->getLocked(k.first, k.second);
  }

  outcome::result<void> InMemoryTransaction::put(std::string_view space,
                                                 const ByteView &key,
                                                 ByteVecOrView &&value) {
    if (finished_) {
      return StorageError::INVALID_ARGUMENT;
    }
    Key k{std::string(space), toByteVec(key)};
    {
      std::lock_guard lock(engine_->mutex_);
      observeLocked(k);
    }
    writes_.insert_or_assign(std::move(k), std::move(value).intoByteVec());
    return outcome::success();
  }

  outcome::result<void> InMemoryTransaction::remove(std::string_view space,
                                                    const ByteView &key) {
    if (finished_) {
      return StorageError::INVALID_ARGUMENT;
    }
    Key k{std::string(space), toByteVec(key)};
    {
      std::lock_guard lock(engine_->mutex_);
      observeLocked(k);
    }
    writes_.insert_or_assign(std::move(k), std::nullopt);
    return outcome::success();
  }

  outcome::result<void> InMemoryTransaction::commit() {
    if (finished_) {
      return StorageError::INVALID_ARGUMENT;
    }
    finished_ = true;
    std::lock_guard lock(engine_->mutex_);
    for (const auto &[key, version] : observed_) {
      if (engine_->versionLocked(key.first, key.second) != version) {
        return StorageError::CONFLICT;
      }
    }
    for (auto &[key, value] : writes_) {
      if (value.has_value()) {
        engine_->putLocked(key.first, key.second, std::move(*value));
      } else {
        engine_->removeLocked(key.first, key.second);
      }
    }
    return outcome::success();
  }

  void InMemoryTransaction::rollback() {
    finished_ = true;
    observed_.clear();
    writes_.clear();
  }

  void InMemoryTransaction::observeLocked(const Key &key) {
    if (not observed_.contains(key)) {
      observed_.emplace(key, engine_->versionLocked(key.first, key.second));
    }
  }

}  // namespace kv::storage
