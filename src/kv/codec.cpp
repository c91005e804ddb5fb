/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "kv/codec.hpp"

namespace kv {

  bool isValidUtf8(std::string_view str) {
    size_t i = 0;
    while (i < str.size()) {
      auto c = static_cast<uint8_t>(str[i]);
      size_t len = 0;
      uint32_t cp = 0;
      if (c < 0x80) {
        ++i;
        continue;
      }
      if ((c & 0xE0) == 0xC0) {
        len = 2;
        cp = c & 0x1F;
      } else if ((c & 0xF0) == 0xE0) {
        len = 3;
        cp = c & 0x0F;
      } else if ((c & 0xF8) == 0xF0) {
        len = 4;
        cp = c & 0x07;
      } else {
        return false;
      }
      if (i + len > str.size()) {
        return false;
      }
      for (size_t j = 1; j < len; ++j) {
        auto cc = static_cast<uint8_t>(str[i + j]);
        if ((cc & 0xC0) != 0x80) {
          return false;
        }
        cp = (cp << 6) | (cc & 0x3F);
      }
      // overlong forms, surrogates and out of range code points
      if ((len == 2 and cp < 0x80) or (len == 3 and cp < 0x800)
          or (len == 4 and cp < 0x10000) or cp > 0x10FFFF
          or (cp >= 0xD800 and cp <= 0xDFFF)) {
        return false;
      }
      i += len;
    }
    return true;
  }

  outcome::result<qtils::ByteVec> Codec<std::string>::encode(
      const std::string &v) {
    if (not isValidUtf8(v)) {
      return EncodeError::NOT_REPRESENTABLE;
    }
    return qtils::ByteVec(v.begin(), v.end());
  }

  outcome::result<std::string> Codec<std::string>::decode(
      qtils::ByteView bytes) {
    std::string str(bytes.begin(), bytes.end());
    if (not isValidUtf8(str)) {
      return DecodeError::INVALID_UTF8;
    }
    return str;
  }

}  // namespace kv
