/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "kv/codec.hpp"

namespace kv {

  template <Key K, Value V>
  class Bucket;

  /**
   * Pending writes of one bucket. Values are encoded when added, so an
   * encoding error is reported by set() and never by Bucket::apply().
   */
  template <Key K, Value V>
  class Batch {
   public:
    outcome::result<void> set(const K &key, const V &value) {
      OUTCOME_TRY(raw_key, Codec<K>::encode(key));
      OUTCOME_TRY(raw_value, Codec<V>::encode(value));
      operations_.emplace_back(std::move(raw_key), std::move(raw_value));
      return outcome::success();
    }

    outcome::result<void> remove(const K &key) {
      OUTCOME_TRY(raw_key, Codec<K>::encode(key));
      operations_.emplace_back(std::move(raw_key), std::nullopt);
      return outcome::success();
    }

    size_t size() const {
      return operations_.size();
    }

    bool empty() const {
      return operations_.empty();
    }

    void clear() {
      operations_.clear();
    }

   private:
    friend class Bucket<K, V>;

    // nullopt value is a removal
    std::vector<std::pair<qtils::ByteVec, std::optional<qtils::ByteVec>>>
        operations_;
  };

}  // namespace kv
