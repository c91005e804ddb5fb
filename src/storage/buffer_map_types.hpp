/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Convenience aliases for the byte-level storage interfaces.
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/byte_vec_or_view.hpp>

#include "storage/face/generic_maps.hpp"
#include "storage/face/write_batch.hpp"

namespace kv::storage {

  using qtils::ByteVec;
  using qtils::ByteVecOrView;
  using qtils::ByteView;

  using BufferBatch = face::WriteBatch;

  using BufferStorage = face::GenericStorage;

  using BufferStorageCursor = face::MapCursor;

}  // namespace kv::storage
