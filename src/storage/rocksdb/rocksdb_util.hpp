/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <rocksdb/status.h>

#include "log/logger.hpp"
#include "storage/storage_error.hpp"

namespace kv::storage {
  inline StorageError status_as_error(const rocksdb::Status &s,
                                      const log::Logger &log) {
    if (s.IsNotFound()) {
      return StorageError::NOT_FOUND;
    }

    if (s.IsBusy() or s.IsTryAgain()) {
      SL_TRACE(log, "conflict: {}", s.ToString());
      return StorageError::CONFLICT;
    }

    if (s.IsIOError()) {
      SL_ERROR(log, "IO error: {}", s.ToString());
      return StorageError::IO_ERROR;
    }

    if (s.IsInvalidArgument()) {
      SL_DEBUG(log, "invalid argument: {}", s.ToString());
      return StorageError::INVALID_ARGUMENT;
    }

    if (s.IsCorruption()) {
      SL_ERROR(log, "corruption: {}", s.ToString());
      return StorageError::CORRUPTION;
    }

    if (s.IsNotSupported()) {
      return StorageError::NOT_SUPPORTED;
    }

    SL_ERROR(log, "unexpected status: {}", s.ToString());
    return StorageError::UNKNOWN;
  }

  inline rocksdb::Slice make_slice(const qtils::ByteView &buf) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto *ptr = reinterpret_cast<const char *>(buf.data());
    return rocksdb::Slice{ptr, buf.size()};
  }

  inline qtils::ByteVec make_buffer(const rocksdb::Slice &s) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto *ptr = reinterpret_cast<const uint8_t *>(s.data());
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    return {ptr, ptr + s.size()};
  }

  inline qtils::ByteVec make_buffer(const std::string &s) {
    return make_buffer(rocksdb::Slice{s});
  }

  inline bool equal_bytes(const std::string &stored,
                          const qtils::ByteView &expected) {
    return stored.size() == expected.size()
       and std::equal(expected.begin(),
                      expected.end(),
                      reinterpret_cast<const uint8_t *>(  // NOLINT
                          stored.data()));
  }
}  // namespace kv::storage
