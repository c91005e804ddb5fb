/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Composite interface of one storage space.
 *
 * Combines readable, writable, exchangeable, iterable and batched write
 * support into the capability the typed layer builds on.
 */

#pragma once

#include "storage/face/batch_writeable.hpp"
#include "storage/face/exchangeable.hpp"
#include "storage/face/iterable.hpp"
#include "storage/face/readable.hpp"
#include "storage/face/writeable.hpp"

namespace kv::storage::face {

  struct GenericStorage : Readable,
                          Iterable,
                          Writeable,
                          Exchangeable,
                          BatchWriteable {};

}  // namespace kv::storage::face
