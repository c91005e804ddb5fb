/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/storage_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(kv::storage, StorageError, e) {
  using E = StorageError;
  switch (e) {
    case E::OK:
      return "success";
    case E::NOT_SUPPORTED:
      return "operation is not supported by this engine";
    case E::CORRUPTION:
      return "engine reported corrupted data";
    case E::INVALID_ARGUMENT:
      return "invalid argument passed to engine";
    case E::IO_ERROR:
      return "engine I/O failure";
    case E::NOT_FOUND:
      return "no such space or entry";
    case E::DB_PATH_NOT_CREATED:
      return "database directory does not exist and was not created";
    case E::STORAGE_GONE:
      return "engine or space is already closed";
    case E::CONFLICT:
      return "concurrent modification conflict";
    case E::UNKNOWN:
      break;
  }

  return "unknown engine error";
}
