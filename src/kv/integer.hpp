/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <compare>

#include "kv/codec.hpp"

namespace kv {

  /**
   * Integer stored in order-preserving encoding. Same bytes as the plain
   * integral codec; the wrapper makes the intent explicit in bucket types.
   */
  template <std::integral T>
    requires(not std::same_as<T, bool>)
  struct Integer {
    T value{};

    Integer() = default;
    Integer(T v) : value{v} {}  // NOLINT(google-explicit-constructor)

    operator T() const {  // NOLINT(google-explicit-constructor)
      return value;
    }

    auto operator<=>(const Integer &) const = default;
  };

  template <std::integral T>
  struct Codec<Integer<T>> {
    static constexpr bool kOrdered = true;

    static outcome::result<qtils::ByteVec> encode(const Integer<T> &v) {
      return Codec<T>::encode(v.value);
    }

    static outcome::result<Integer<T>> decode(qtils::ByteView bytes) {
      OUTCOME_TRY(value, Codec<T>::decode(bytes));
      return Integer<T>{value};
    }
  };

}  // namespace kv
