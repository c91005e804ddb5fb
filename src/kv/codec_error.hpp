/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace kv {

  /// Stored bytes can not be converted to the requested type
  enum class DecodeError : uint8_t {
    INVALID_LENGTH = 1,  ///< fixed-width value of wrong size
    INVALID_UTF8,        ///< text is not valid UTF-8
    MALFORMED_JSON,      ///< bytes are not JSON
    SCHEMA_MISMATCH,     ///< JSON does not fit the target structure
  };

  enum class EncodeError : uint8_t {
    NOT_REPRESENTABLE = 1,
  };

}  // namespace kv

OUTCOME_HPP_DECLARE_ERROR(kv, DecodeError);
OUTCOME_HPP_DECLARE_ERROR(kv, EncodeError);
