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
   * @brief Mixin for single-key read-modify-write operations.
   *
   * Both operations are atomic with respect to any other writer of the
   * same key, which a separate get followed by put is not.
   */
  struct Exchangeable {
    virtual ~Exchangeable() = default;

    /**
     * @brief Replace the value of a key, or delete it if value is nullopt.
     * @return the value stored before, if there was one
     */
    virtual outcome::result<std::optional<qtils::ByteVec>> exchange(
        const qtils::ByteView &key,
        const std::optional<qtils::ByteView> &value) = 0;

    /**
     * @brief Set key to proposed only if its current value equals expected.
     * nullopt as expected means "key is absent", nullopt as proposed means
     * "delete the key".
     * @return true if the swap happened, false if the current value differed
     */
    virtual outcome::result<bool> compareAndSwap(
        const qtils::ByteView &key,
        const std::optional<qtils::ByteView> &expected,
        const std::optional<qtils::ByteView> &proposed) = 0;
  };

}  // namespace kv::storage::face
