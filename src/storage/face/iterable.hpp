/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

namespace kv::storage::face {

  /**
   * @brief Ordered cursor over a byte map.
   *
   * Keys are visited in ascending byte-lexicographic order. A freshly
   * created cursor is not positioned; one of the seek methods must be
   * called first.
   */
  struct MapCursor {
    virtual ~MapCursor() = default;

    /// Position at the smallest key; false if the map is empty
    virtual outcome::result<bool> seekFirst() = 0;

    /// Position at the smallest key not less than the given one
    virtual outcome::result<bool> seek(const qtils::ByteView &key) = 0;

    /// Position at the largest key; false if the map is empty
    virtual outcome::result<bool> seekLast() = 0;

    [[nodiscard]] virtual bool isValid() const = 0;

    virtual outcome::result<void> next() = 0;

    virtual outcome::result<void> prev() = 0;

    [[nodiscard]] virtual std::optional<qtils::ByteVec> key() const = 0;

    [[nodiscard]] virtual std::optional<qtils::ByteVec> value() const = 0;
  };

  /**
   * @brief Mixin for storages which can be traversed with a cursor.
   */
  struct Iterable {
    using Cursor = MapCursor;

    virtual ~Iterable() = default;

    /// Cursor over a consistent view of the storage taken at this call
    virtual outcome::result<std::unique_ptr<Cursor>> cursor() = 0;
  };

}  // namespace kv::storage::face
