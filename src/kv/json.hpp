/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "kv/codec.hpp"
#include "serde/json.hpp"

namespace kv {

  /**
   * Value stored as JSON text. T is anything kv::json can encode and decode:
   * scalars, strings, containers, and structs declaring JSON_FIELDS.
   */
  template <typename T>
  struct Json {
    T value{};

    T &operator*() {
      return value;
    }
    const T &operator*() const {
      return value;
    }
    T *operator->() {
      return &value;
    }
    const T *operator->() const {
      return &value;
    }

    bool operator==(const Json &) const = default;
  };

  template <typename T>
  Json(T) -> Json<T>;

  template <typename T>
  struct Codec<Json<T>> {
    // JSON text does not sort like the values it encodes
    static constexpr bool kOrdered = false;

    static outcome::result<qtils::ByteVec> encode(const Json<T> &v) {
      try {
        auto text = json::encode(v.value);
        return qtils::ByteVec(text.begin(), text.end());
      } catch (const json::JsonError &) {
        return EncodeError::NOT_REPRESENTABLE;
      }
    }

    static outcome::result<Json<T>> decode(qtils::ByteView bytes) {
      Json<T> v;
      try {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        json::decode(v.value,
                     std::string_view{
                         reinterpret_cast<const char *>(bytes.data()),
                         bytes.size()});
      } catch (const json::JsonSyntaxError &) {
        return DecodeError::MALFORMED_JSON;
      } catch (const json::JsonError &) {
        return DecodeError::SCHEMA_MISMATCH;
      }
      return v;
    }
  };

}  // namespace kv
