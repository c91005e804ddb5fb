/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "storage/face/write_batch.hpp"

namespace kv::storage::face {

  /**
   * @brief Mixin for storages able to create write batches bound to them.
   */
  struct BatchWriteable {
    virtual ~BatchWriteable() = default;

    /**
     * @brief Create a new, empty write batch.
     */
    virtual std::unique_ptr<WriteBatch> batch() = 0;
  };

}  // namespace kv::storage::face
