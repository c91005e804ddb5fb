/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Interface for modifiable byte map.
 */

#pragma once

#include <qtils/byte_vec_or_view.hpp>
#include <qtils/outcome.hpp>

namespace kv::storage::face {

  /**
   * @brief Mixin exposing plain put and remove.
   *
   * Implementations either apply each operation immediately or record it
   * as part of a larger batch.
   */
  struct Writeable {
    virtual ~Writeable() = default;

    /**
     * @brief Store or update a value by key.
     */
    virtual outcome::result<void> put(const qtils::ByteView &key,
                                      qtils::ByteVecOrView &&value) = 0;

    /**
     * @brief Remove a value by key. Removing an absent key is not an error.
     */
    virtual outcome::result<void> remove(const qtils::ByteView &key) = 0;
  };

}  // namespace kv::storage::face
