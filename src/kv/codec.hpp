/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>
#include <string>
#include <string_view>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

#include "kv/codec_error.hpp"

namespace kv {

  /**
   * Conversion of a typed value to bytes and back. Specializations provide
   *   static outcome::result<qtils::ByteVec> encode(const T &);
   *   static outcome::result<T> decode(qtils::ByteView);
   *   static constexpr bool kOrdered;
   * kOrdered means byte-lexicographic order of encodings equals the order
   * of values, which makes the type usable as a key.
   */
  template <typename T>
  struct Codec;

  template <typename T>
  concept Value = requires(const T &v, qtils::ByteView bytes) {
    { Codec<T>::encode(v) } -> std::same_as<outcome::result<qtils::ByteVec>>;
    { Codec<T>::decode(bytes) } -> std::same_as<outcome::result<T>>;
  };

  template <typename T>
  concept Key = Value<T> and Codec<T>::kOrdered;

  /// Passthrough bytes
  using Raw = qtils::ByteVec;

  template <>
  struct Codec<qtils::ByteVec> {
    static constexpr bool kOrdered = true;

    static outcome::result<qtils::ByteVec> encode(const qtils::ByteVec &v) {
      return v;
    }

    static outcome::result<qtils::ByteVec> decode(qtils::ByteView bytes) {
      return qtils::ByteVec(bytes.begin(), bytes.end());
    }
  };

  bool isValidUtf8(std::string_view str);

  /// UTF-8 text, ordered bytewise (which is code point order)
  template <>
  struct Codec<std::string> {
    static constexpr bool kOrdered = true;

    static outcome::result<qtils::ByteVec> encode(const std::string &v);

    static outcome::result<std::string> decode(qtils::ByteView bytes);
  };

  /// Fixed-width big-endian; the sign bit of signed types is flipped so
  /// negative numbers sort before positive ones
  template <std::integral T>
    requires(not std::same_as<T, bool>)
  struct Codec<T> {
    static constexpr bool kOrdered = true;

    using U = std::make_unsigned_t<T>;
    static constexpr U kSignFlip =
        std::is_signed_v<T> ? U(U{1} << (sizeof(T) * 8 - 1)) : U{0};

    static outcome::result<qtils::ByteVec> encode(const T &v) {
      auto x = static_cast<U>(static_cast<U>(v) ^ kSignFlip);
      qtils::ByteVec out(sizeof(T));
      for (size_t i = sizeof(T); i > 0; --i) {
        out[i - 1] = static_cast<uint8_t>(x & 0xff);
        if constexpr (sizeof(T) > 1) {
          x >>= 8;
        }
      }
      return out;
    }

    static outcome::result<T> decode(qtils::ByteView bytes) {
      if (bytes.size() != sizeof(T)) {
        return DecodeError::INVALID_LENGTH;
      }
      U x = 0;
      for (auto byte : bytes) {
        if constexpr (sizeof(T) > 1) {
          x <<= 8;
        }
        x = static_cast<U>(x | byte);
      }
      return static_cast<T>(static_cast<U>(x ^ kSignFlip));
    }
  };

}  // namespace kv
