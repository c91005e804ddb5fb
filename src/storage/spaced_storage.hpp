/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Declares the SpacedStorage interface, which provides access to
 *        separate named storage spaces represented by BufferStorage, and
 *        transactions spanning any number of them.
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "storage/buffer_map_types.hpp"

namespace kv::storage {

  /**
   * @class SpacedTransaction
   * @brief Engine transaction over several spaces.
   *
   * Reads and writes made through a transaction are invisible to others
   * until commit(). Commit fails with StorageError::CONFLICT if any key
   * the transaction accessed was modified by someone else in the meantime;
   * nothing is applied in that case.
   */
  class SpacedTransaction {
   public:
    virtual ~SpacedTransaction() = default;

    virtual outcome::result<std::optional<ByteVec>> tryGet(
        std::string_view space, const ByteView &key) = 0;

    virtual outcome::result<void> put(std::string_view space,
                                      const ByteView &key,
                                      ByteVecOrView &&value) = 0;

    virtual outcome::result<void> remove(std::string_view space,
                                         const ByteView &key) = 0;

    virtual outcome::result<void> commit() = 0;

    /// Discards every change. Safe to call more than once.
    virtual void rollback() = 0;
  };

  /**
   * @class SpacedStorage
   * @brief Abstract interface of a storage engine partitioned into spaces.
   */
  class SpacedStorage {
   public:
    virtual ~SpacedStorage() = default;

    /**
     * Retrieve the map representing particular storage space, creating the
     * space if it does not exist yet
     * @param space - name of required space
     */
    virtual outcome::result<std::shared_ptr<BufferStorage>> getSpace(
        std::string_view space) = 0;

    /// Names of all existing spaces, the default one included
    [[nodiscard]] virtual outcome::result<std::vector<std::string>>
    spaceNames() const = 0;

    /**
     * Erase a space with all its data. Handles obtained before stay valid;
     * they refer to the space by name, which is empty after the drop.
     * @return true if the space existed
     */
    virtual outcome::result<bool> dropSpace(std::string_view space) = 0;

    virtual outcome::result<std::unique_ptr<SpacedTransaction>>
    beginTransaction() = 0;

    /// Persist everything written so far
    virtual outcome::result<void> flush() = 0;
  };

}  // namespace kv::storage
