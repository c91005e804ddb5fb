/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_spaced_storage.hpp"

#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/in_memory/in_memory_transaction.hpp"
#include "storage/spaces.hpp"
#include "storage/storage_error.hpp"

namespace kv::storage {

  InMemorySpacedStorage::InMemorySpacedStorage() {
    spaces_.emplace(std::string(kDefaultSpaceName), Space{});
  }

  outcome::result<std::shared_ptr<BufferStorage>>
  InMemorySpacedStorage::getSpace(std::string_view space) {
    if (space.empty()) {
      return StorageError::INVALID_ARGUMENT;
    }
    std::lock_guard lock(mutex_);
    spaceLocked(space);
    if (auto it = handles_.find(space); it != handles_.end()) {
      return it->second;
    }
    auto handle =
        std::make_shared<InMemoryStorage>(weak_from_this(), std::string(space));
    handles_.emplace(std::string(space), handle);
    return handle;
  }

  outcome::result<std::vector<std::string>>
  InMemorySpacedStorage::spaceNames() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> names;
    names.reserve(spaces_.size());
    for (const auto &[name, _] : spaces_) {
      names.emplace_back(name);
    }
    return names;
  }

  outcome::result<bool> InMemorySpacedStorage::dropSpace(
      std::string_view space) {
    if (space.empty() or space == kDefaultSpaceName) {
      return StorageError::INVALID_ARGUMENT;
    }
    std::lock_guard lock(mutex_);
    auto it = spaces_.find(space);
    if (it == spaces_.end()) {
      return false;
    }
    spaces_.erase(it);
    handles_.erase(space);
    last_drop_ = ++sequence_;
    return true;
  }

  outcome::result<std::unique_ptr<SpacedTransaction>>
  InMemorySpacedStorage::beginTransaction() {
    return std::make_unique<InMemoryTransaction>(shared_from_this());
  }

  outcome::result<void> InMemorySpacedStorage::flush() {
    return outcome::success();
  }

  InMemorySpacedStorage::Space &InMemorySpacedStorage::spaceLocked(
      std::string_view space) {
    auto it = spaces_.find(space);
    if (it == spaces_.end()) {
      it = spaces_.emplace(std::string(space), Space{.floor = ++sequence_})
               .first;
    }
    return it->second;
  }

  InMemorySpacedStorage::Entries &InMemorySpacedStorage::writableLocked(
      Space &space) {
    if (space.entries.use_count() > 1) {
      space.entries = std::make_shared<Entries>(*space.entries);
    }
    return *space.entries;
  }

  std::optional<ByteVec> InMemorySpacedStorage::getLocked(
      std::string_view space, const ByteVec &key) const {
    auto space_it = spaces_.find(space);
    if (space_it == spaces_.end()) {
      return std::nullopt;
    }
    const auto &entries = *space_it->second.entries;
    auto it = entries.find(key);
    if (it == entries.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void InMemorySpacedStorage::putLocked(std::string_view space,
                                        const ByteVec &key,
                                        ByteVec value) {
    auto &target = spaceLocked(space);
    writableLocked(target).insert_or_assign(key, std::move(value));
    target.versions.insert_or_assign(key, ++sequence_);
  }

  void InMemorySpacedStorage::removeLocked(std::string_view space,
                                           const ByteVec &key) {
    auto space_it = spaces_.find(space);
    if (space_it == spaces_.end()) {
      return;
    }
    auto &target = space_it->second;
    if (not target.entries->contains(key)) {
      return;
    }
    writableLocked(target).erase(key);
    target.versions.erase(key);
    target.floor = ++sequence_;
  }

  uint64_t InMemorySpacedStorage::versionLocked(std::string_view space,
                                                const ByteVec &key) const {
    auto space_it = spaces_.find(space);
    if (space_it == spaces_.end()) {
      return last_drop_;
    }
    const auto &versions = space_it->second.versions;
    auto it = versions.find(key);
    return it == versions.end() ? space_it->second.floor : it->second;
  }

  InMemorySpacedStorage::EntriesPtr InMemorySpacedStorage::snapshotLocked(
      std::string_view space) const {
    auto it = spaces_.find(space);
    if (it == spaces_.end()) {
      return std::make_shared<const Entries>();
    }
    return it->second.entries;
  }

}  // namespace kv::storage
