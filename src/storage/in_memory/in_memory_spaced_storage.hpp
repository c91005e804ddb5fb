/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @file in_memory_spaced_storage.hpp
 * @brief Implements an in-memory version of SpacedStorage.
 *
 * Useful for unit tests and other scenarios where a persistent backend is
 * not required or desired. Supports transactions with the same conflict
 * semantics as the persistent engine.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include "storage/buffer_map_types.hpp"
#include "storage/spaced_storage.hpp"

namespace kv::storage {

  class InMemoryStorage;

  /**
   * @class InMemorySpacedStorage
   * @brief In-memory implementation of the SpacedStorage interface.
   *
   * All spaces share one mutex, so every single operation and every batch
   * or transaction commit is atomic. Each write bumps the version of the
   * key, transactions compare versions on commit.
   *
   * Versions are kept for live keys only. An absent key has the version of
   * the last removal in its space, a key of a missing space the version of
   * the last dropped space. Both can only grow, so a transaction which saw
   * a key absent still notices it being written and removed again.
   */
  class InMemorySpacedStorage
      : public SpacedStorage,
        public std::enable_shared_from_this<InMemorySpacedStorage> {
   public:
    using Entries = std::map<ByteVec, ByteVec>;
    using EntriesPtr = std::shared_ptr<const Entries>;

    InMemorySpacedStorage();

    outcome::result<std::shared_ptr<BufferStorage>> getSpace(
        std::string_view space) override;

    outcome::result<std::vector<std::string>> spaceNames() const override;

    outcome::result<bool> dropSpace(std::string_view space) override;

    outcome::result<std::unique_ptr<SpacedTransaction>> beginTransaction()
        override;

    /// Nothing to persist
    outcome::result<void> flush() override;

    friend class InMemoryStorage;
    friend class InMemoryBatch;
    friend class InMemoryTransaction;

   private:
    struct Space {
      // shared with cursors, copied by the first write after that
      std::shared_ptr<Entries> entries = std::make_shared<Entries>();
      std::map<ByteVec, uint64_t> versions;
      // version of every absent key
      uint64_t floor = 0;
    };

    // all *Locked methods expect mutex_ to be held
    Space &spaceLocked(std::string_view space);
    Entries &writableLocked(Space &space);
    std::optional<ByteVec> getLocked(std::string_view space,
                                     const ByteVec &key) const;
    void putLocked(std::string_view space, const ByteVec &key, ByteVec value);
    void removeLocked(std::string_view space, const ByteVec &key);
    uint64_t versionLocked(std::string_view space, const ByteVec &key) const;
    EntriesPtr snapshotLocked(std::string_view space) const;

    mutable std::mutex mutex_;
    std::map<std::string, Space, std::less<>> spaces_;
    uint64_t sequence_ = 0;
    uint64_t last_drop_ = 0;
    std::map<std::string, std::shared_ptr<InMemoryStorage>, std::less<>>
        handles_;
  };

}  // namespace kv::storage
