/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

namespace kv::storage::face {

  /**
   * @brief A mixin for read-only byte map.
   */
  struct Readable {
    virtual ~Readable() = default;

    /**
     * @brief Checks if given key-value binding exists in the storage.
     * @return true if key has value, false if does not, or error
     */
    [[nodiscard]] virtual outcome::result<bool> contains(
        const qtils::ByteView &key) const = 0;

    /**
     * @brief Get value by key
     * @return value if present, std::nullopt if absent, or error
     */
    [[nodiscard]] virtual outcome::result<std::optional<qtils::ByteVec>>
    tryGet(const qtils::ByteView &key) const = 0;
  };

}  // namespace kv::storage::face
