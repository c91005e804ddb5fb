/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

#include "storage/buffer_map_types.hpp"

namespace kv::storage {

  class InMemorySpacedStorage;

  /**
   * One space of InMemorySpacedStorage. Keeps only the name of the space
   * and a weak reference to the engine.
   */
  class InMemoryStorage : public BufferStorage {
   public:
    InMemoryStorage(std::weak_ptr<InMemorySpacedStorage> engine,
                    std::string space);

    ~InMemoryStorage() override = default;

    [[nodiscard]] outcome::result<std::optional<ByteVec>> tryGet(
        const ByteView &key) const override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    [[nodiscard]] outcome::result<bool> contains(
        const ByteView &key) const override;

    outcome::result<void> remove(const ByteView &key) override;

    outcome::result<std::optional<ByteVec>> exchange(
        const ByteView &key, const std::optional<ByteView> &value) override;

    outcome::result<bool> compareAndSwap(
        const ByteView &key,
        const std::optional<ByteView> &expected,
        const std::optional<ByteView> &proposed) override;

    std::unique_ptr<BufferBatch> batch() override;

    outcome::result<std::unique_ptr<Cursor>> cursor() override;

   private:
    outcome::result<std::shared_ptr<InMemorySpacedStorage>> use() const;

    std::weak_ptr<InMemorySpacedStorage> engine_;
    std::string space_;
  };

  inline ByteVec toByteVec(const ByteView &view) {
    return ByteVec(view.begin(), view.end());
  }

}  // namespace kv::storage
