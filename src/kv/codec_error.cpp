/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "kv/codec_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(kv, DecodeError, e) {
  using E = kv::DecodeError;
  switch (e) {
    case E::INVALID_LENGTH:
      return "Encoded value has unexpected length";
    case E::INVALID_UTF8:
      return "Encoded string is not valid UTF-8";
    case E::MALFORMED_JSON:
      return "Encoded value is not valid JSON";
    case E::SCHEMA_MISMATCH:
      return "Encoded JSON does not match the expected structure";
  }
  return "Unknown DecodeError";
}

OUTCOME_CPP_DEFINE_CATEGORY(kv, EncodeError, e) {
  using E = kv::EncodeError;
  switch (e) {
    case E::NOT_REPRESENTABLE:
      return "Value can not be represented in the target encoding";
  }
  return "Unknown EncodeError";
}
