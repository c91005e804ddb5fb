/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <memory>
#include <optional>

#include "kv/codec.hpp"
#include "storage/buffer_map_types.hpp"

namespace kv {

  /**
   * One entry met by Iter. Key and value stay encoded until asked for,
   * each of them is decoded independently.
   */
  template <Key K, Value V>
  class Item {
   public:
    Item(qtils::ByteVec raw_key, qtils::ByteVec raw_value)
        : raw_key_{std::move(raw_key)}, raw_value_{std::move(raw_value)} {}

    outcome::result<K> key() const {
      return Codec<K>::decode(qtils::ByteView{raw_key_});
    }

    outcome::result<V> value() const {
      return Codec<V>::decode(qtils::ByteView{raw_value_});
    }

    const qtils::ByteVec &rawKey() const {
      return raw_key_;
    }

    const qtils::ByteVec &rawValue() const {
      return raw_value_;
    }

   private:
    qtils::ByteVec raw_key_;
    qtils::ByteVec raw_value_;
  };

  /**
   * Forward pass over a bucket in encoded key order. The view is fixed when
   * the iterator is created; writes made afterwards are not observed.
   * Can not be restarted, ask the bucket for a new one instead.
   */
  template <Key K, Value V>
  class Iter {
   public:
    using Cursor = storage::BufferStorageCursor;

    struct Bounds {
      /// Inclusive
      std::optional<qtils::ByteVec> lower;
      /// Exclusive
      std::optional<qtils::ByteVec> upper;
      std::optional<qtils::ByteVec> prefix;
    };

    Iter(outcome::result<std::unique_ptr<Cursor>> cursor, Bounds bounds)
        : bounds_{std::move(bounds)} {
      if (cursor.has_value()) {
        cursor_ = std::move(cursor.value());
      } else {
        error_ = cursor.error();
      }
    }

    /**
     * @return next item, std::nullopt once the end is reached; after an
     * error the iterator is finished
     */
    outcome::result<std::optional<Item<K, V>>> next() {
      if (done_) {
        return std::nullopt;
      }
      if (error_) {
        done_ = true;
        return *error_;
      }
      auto res = advance();
      if (res.has_error()) {
        done_ = true;
        return res.error();
      }
      if (not res.value()) {
        done_ = true;
        cursor_.reset();
        return std::nullopt;
      }
      auto key = cursor_->key();
      auto value = cursor_->value();
      if (not key or not value or not withinBounds(*key)) {
        done_ = true;
        cursor_.reset();
        return std::nullopt;
      }
      return Item<K, V>{std::move(*key), std::move(*value)};
    }

   private:
    outcome::result<bool> advance() {
      if (started_) {
        OUTCOME_TRY(cursor_->next());
        return cursor_->isValid();
      }
      started_ = true;
      const auto &from = bounds_.lower ? bounds_.lower : bounds_.prefix;
      if (from and bounds_.prefix and *bounds_.prefix > *from) {
        return cursor_->seek(*bounds_.prefix);
      }
      if (from) {
        return cursor_->seek(*from);
      }
      return cursor_->seekFirst();
    }

    bool withinBounds(const qtils::ByteVec &key) const {
      if (bounds_.upper and not(key < *bounds_.upper)) {
        return false;
      }
      if (bounds_.prefix) {
        const auto &prefix = *bounds_.prefix;
        return key.size() >= prefix.size()
           and std::equal(prefix.begin(), prefix.end(), key.begin());
      }
      return true;
    }

    std::unique_ptr<Cursor> cursor_;
    std::optional<std::error_code> error_;
    Bounds bounds_;
    bool started_ = false;
    bool done_ = false;
  };

}  // namespace kv
