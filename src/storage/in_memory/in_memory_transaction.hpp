/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>

#include "storage/in_memory/in_memory_spaced_storage.hpp"

namespace kv::storage {

  /**
   * Remembers the version of every key it touches and buffers writes.
   * Commit applies the writes only if none of those versions changed.
   */
  class InMemoryTransaction : public SpacedTransaction {
   public:
    explicit InMemoryTransaction(
        std::shared_ptr<InMemorySpacedStorage> engine);

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
    using Key = std::pair<std::string, ByteVec>;

    // mutex of the engine must be held
    void observeLocked(const Key &key);

    std::shared_ptr<InMemorySpacedStorage> engine_;
    std::map<Key, uint64_t> observed_;
    std::map<Key, std::optional<ByteVec>> writes_;
    bool finished_ = false;
  };

}  // namespace kv::storage
