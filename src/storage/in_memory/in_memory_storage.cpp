/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include <algorithm>

#include "storage/in_memory/cursor.hpp"
#include "storage/in_memory/in_memory_batch.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "storage/storage_error.hpp"

namespace kv::storage {

  namespace {
    bool sameBytes(const std::optional<ByteVec> &current,
                   const std::optional<ByteView> &expected) {
      if (not current.has_value() or not expected.has_value()) {
        return current.has_value() == expected.has_value();
      }
      return std::ranges::equal(*current, *expected);
    }
  }  // namespace

  InMemoryStorage::InMemoryStorage(
      std::weak_ptr<InMemorySpacedStorage> engine, std::string space)
      : engine_{std::move(engine)}, space_{std::move(space)} {}

  outcome::result<std::optional<ByteVec>> InMemoryStorage::tryGet(
      const ByteView &key) const {
    OUTCOME_TRY(engine, use());
    std::lock_guard lock(engine->mutex_);
    return engine->getLocked(space_, toByteVec(key));
  }

  outcome::result<void> InMemoryStorage::put(const ByteView &key,
                                             ByteVecOrView &&value) {
    OUTCOME_TRY(engine, use());
    std::lock_guard lock(engine->mutex_);
    engine->putLocked(space_, toByteVec(key), std::move(value).intoByteVec());
    return outcome::success();
  }

  outcome::result<bool> InMemoryStorage::contains(const ByteView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    return value.has_value();
  }

  outcome::result<void> InMemoryStorage::remove(const ByteView &key) {
    OUTCOME_TRY(engine, use());
    std::lock_guard lock(engine->mutex_);
    engine->removeLocked(space_, toByteVec(key));
    return outcome::success();
  }

  outcome::result<std::optional<ByteVec>> InMemoryStorage::exchange(
      const ByteView &key, const std::optional<ByteView> &value) {
    OUTCOME_TRY(engine, use());
    auto k = toByteVec(key);
    std::lock_guard lock(engine->mutex_);
    auto previous = engine->getLocked(space_, k);
    if (value.has_value()) {
      engine->putLocked(space_, k, toByteVec(*value));
    } else {
      engine->removeLocked(space_, k);
    }
    return previous;
  }

  outcome::result<bool> InMemoryStorage::compareAndSwap(
      const ByteView &key,
      const std::optional<ByteView> &expected,
      const std::optional<ByteView> &proposed) {
    OUTCOME_TRY(engine, use());
    auto k = toByteVec(key);
    std::lock_guard lock(engine->mutex_);
    if (not sameBytes(engine->getLocked(space_, k), expected)) {
      return false;
    }
    if (proposed.has_value()) {
      engine->putLocked(space_, k, toByteVec(*proposed));
    } else {
      engine->removeLocked(space_, k);
    }
    return true;
  }

  std::unique_ptr<BufferBatch> InMemoryStorage::batch() {
    return std::make_unique<InMemoryBatch>(engine_, space_);
  }

  outcome::result<std::unique_ptr<BufferStorage::Cursor>>
  InMemoryStorage::cursor() {
    OUTCOME_TRY(engine, use());
    std::lock_guard lock(engine->mutex_);
    return std::make_unique<InMemoryCursor>(engine->snapshotLocked(space_));
  }

  outcome::result<std::shared_ptr<InMemorySpacedStorage>>
  InMemoryStorage::use() const {
    auto engine = engine_.lock();
    if (not engine) {
      return StorageError::STORAGE_GONE;
    }
    return engine;
  }
}  // namespace kv::storage
