/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Interface for batch write operations on storage.
 *
 * A WriteBatch accumulates write operations and applies them in a single
 * atomic commit: after commit either all of them are visible or none is.
 */

#pragma once

#include <cstddef>

#include "storage/face/writeable.hpp"

namespace kv::storage::face {

  struct WriteBatch : public Writeable {
    /**
     * @brief Applies all accumulated operations atomically, in the order
     * they were recorded; a later operation on a key overrides an earlier
     * one.
     */
    virtual outcome::result<void> commit() = 0;

    /**
     * @brief Removes all pending operations, allowing reuse.
     */
    virtual void clear() = 0;

    /// Number of pending operations
    [[nodiscard]] virtual size_t size() const = 0;
  };

}  // namespace kv::storage::face
