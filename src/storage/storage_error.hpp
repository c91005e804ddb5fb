/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Error codes reported by storage engines.
 *
 * These are surfaced unchanged by the typed layer: a caller seeing a
 * StorageError knows the failure came from the engine itself, not from
 * encoding or decoding.
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace kv::storage {

  enum class StorageError : int {  // NOLINT(performance-enum-size)

    OK = 0,  ///< success (no error)

    NOT_SUPPORTED = 1,        ///< operation is not supported in storage
    CORRUPTION = 2,           ///< data corruption in storage
    INVALID_ARGUMENT = 3,     ///< invalid argument to storage
    IO_ERROR = 4,             ///< IO error in storage
    NOT_FOUND = 5,            ///< entry not found in storage
    DB_PATH_NOT_CREATED = 6,  ///< storage path was not created
    STORAGE_GONE = 7,         ///< storage instance has been uninitialized
    CONFLICT = 8,             ///< concurrent modification of accessed keys

    UNKNOWN = 1000,  ///< unknown error
  };
}  // namespace kv::storage

OUTCOME_HPP_DECLARE_ERROR(kv::storage, StorageError);
