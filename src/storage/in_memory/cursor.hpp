/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>

#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "storage/in_memory/in_memory_storage.hpp"

namespace kv::storage {
  /// Cursor over the space as it was at creation. The entries are shared
  /// with the engine until its next write to the space.
  class InMemoryCursor : public BufferStorageCursor {
   public:
    explicit InMemoryCursor(InMemorySpacedStorage::EntriesPtr snapshot)
        : snapshot_{std::move(snapshot)},
          entries_{*snapshot_},
          it_{entries_.end()} {}

    outcome::result<bool> seekFirst() override {
      it_ = entries_.begin();
      return isValid();
    }

    outcome::result<bool> seek(const ByteView &key) override {
      it_ = entries_.lower_bound(toByteVec(key));
      return isValid();
    }

    outcome::result<bool> seekLast() override {
      it_ = entries_.empty() ? entries_.end() : std::prev(entries_.end());
      return isValid();
    }

    bool isValid() const override {
      return it_ != entries_.end();
    }

    outcome::result<void> next() override {
      if (isValid()) {
        ++it_;
      }
      return outcome::success();
    }

    outcome::result<void> prev() override {
      if (isValid()) {
        it_ = it_ == entries_.begin() ? entries_.end() : std::prev(it_);
      }
      return outcome::success();
    }

    std::optional<ByteVec> key() const override {
      if (isValid()) {
        return it_->first;
      }
      return std::nullopt;
    }

    std::optional<ByteVec> value() const override {
      if (isValid()) {
        return it_->second;
      }
      return std::nullopt;
    }

   private:
    InMemorySpacedStorage::EntriesPtr snapshot_;
    const InMemorySpacedStorage::Entries &entries_;
    InMemorySpacedStorage::Entries::const_iterator it_;
  };
}  // namespace kv::storage
