/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/byte_vec.hpp>

#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/storage_error.hpp"

namespace kv::storage {

  class InMemoryBatch : public BufferBatch {
   public:
    InMemoryBatch(std::weak_ptr<InMemorySpacedStorage> engine,
                  std::string space)
        : engine_{std::move(engine)}, space_{std::move(space)} {}

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override {
      operations_.emplace_back(toByteVec(key),
                               std::move(value).intoByteVec());
      return outcome::success();
    }

    outcome::result<void> remove(const ByteView &key) override {
      operations_.emplace_back(toByteVec(key), std::nullopt);
      return outcome::success();
    }

    outcome::result<void> commit() override {
      auto engine = engine_.lock();
      if (not engine) {
        return StorageError::STORAGE_GONE;
      }
      std::lock_guard lock(engine->mutex_);
      for (auto &[key, value] : operations_) {
        if (value.has_value()) {
          engine->putLocked(space_, key, *value);
        } else {
          engine->removeLocked(space_, key);
        }
      }
      return outcome::success();
    }

    void clear() override {
      operations_.clear();
    }

    size_t size() const override {
      return operations_.size();
    }

   private:
    std::weak_ptr<InMemorySpacedStorage> engine_;
    std::string space_;
    std::vector<std::pair<ByteVec, std::optional<ByteVec>>> operations_;
  };
}  // namespace kv::storage
