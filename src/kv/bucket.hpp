/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <utility>

#include <qtils/shared_ref.hpp>

#include "kv/batch.hpp"
#include "kv/codec.hpp"
#include "kv/iter.hpp"
#include "log/logger.hpp"
#include "storage/spaced_storage.hpp"
#include "storage/spaces.hpp"

namespace kv {

  /**
   * @brief Typed view of one named space of the store.
   *
   * Holds no data and no lock; any number of buckets over the same name may
   * exist at once. Every operation writes through to the engine, except
   * those collected in a Batch or done inside a Transaction.
   */
  template <Key K, Value V>
  class Bucket {
   public:
    using KeyType = K;
    using ValueType = V;

    Bucket(std::optional<std::string> name,
           qtils::SharedRef<storage::SpacedStorage> engine,
           qtils::SharedRef<storage::BufferStorage> space,
           log::Logger logger)
        : name_{std::move(name)},
          space_name_{storage::spaceName(name_)},
          engine_{std::move(engine)},
          space_{std::move(space)},
          logger_{std::move(logger)} {}

    /// Name given at creation; std::nullopt for the default bucket
    const std::optional<std::string> &name() const {
      return name_;
    }

    /// Name of the engine space behind the bucket
    const std::string &spaceName() const {
      return space_name_;
    }

    outcome::result<std::optional<V>> get(const K &key) const {
      OUTCOME_TRY(raw_key, Codec<K>::encode(key));
      OUTCOME_TRY(raw_value, space_->tryGet(raw_key));
      return decodeOptional(raw_value);
    }

    /// @return the value replaced, if there was one
    outcome::result<std::optional<V>> set(const K &key, const V &value) {
      OUTCOME_TRY(raw_key, Codec<K>::encode(key));
      OUTCOME_TRY(raw_value, Codec<V>::encode(value));
      OUTCOME_TRY(previous,
                  space_->exchange(raw_key, qtils::ByteView{raw_value}));
      SL_TRACE(logger_,
               "set in '{}': {} bytes key, {} bytes value",
               space_name_,
               raw_key.size(),
               raw_value.size());
      return decodeOptional(previous);
    }

    /// @return the value removed, if there was one
    outcome::result<std::optional<V>> remove(const K &key) {
      OUTCOME_TRY(raw_key, Codec<K>::encode(key));
      OUTCOME_TRY(previous, space_->exchange(raw_key, std::nullopt));
      SL_TRACE(logger_,
               "remove in '{}': {}",
               space_name_,
               previous ? "existed" : "absent");
      return decodeOptional(previous);
    }

    outcome::result<bool> contains(const K &key) const {
      OUTCOME_TRY(raw_key, Codec<K>::encode(key));
      return space_->contains(raw_key);
    }

    /**
     * Set the key to proposed if it currently holds expected. std::nullopt
     * stands for an absent key on both sides.
     * @return true if the swap happened
     */
    outcome::result<bool> compareAndSwap(const K &key,
                                         const std::optional<V> &expected,
                                         const std::optional<V> &proposed) {
      OUTCOME_TRY(raw_key, Codec<K>::encode(key));
      OUTCOME_TRY(raw_expected, encodeOptional(expected));
      OUTCOME_TRY(raw_proposed, encodeOptional(proposed));
      return space_->compareAndSwap(
          raw_key, asView(raw_expected), asView(raw_proposed));
    }

    Iter<K, V> iter() const {
      return Iter<K, V>{space_->cursor(), {}};
    }

    /// Keys in [from, to)
    outcome::result<Iter<K, V>> iterRange(const K &from, const K &to) const {
      OUTCOME_TRY(lower, Codec<K>::encode(from));
      OUTCOME_TRY(upper, Codec<K>::encode(to));
      return Iter<K, V>{space_->cursor(),
                        {.lower = std::move(lower),
                         .upper = std::move(upper),
                         .prefix = std::nullopt}};
    }

    /// Keys whose encoding starts with the encoding of prefix
    outcome::result<Iter<K, V>> iterPrefix(const K &prefix) const {
      OUTCOME_TRY(raw_prefix, Codec<K>::encode(prefix));
      return Iter<K, V>{space_->cursor(),
                        {.lower = std::nullopt,
                         .upper = std::nullopt,
                         .prefix = std::move(raw_prefix)}};
    }

    /// Entry with the smallest key
    outcome::result<std::optional<std::pair<K, V>>> first() const {
      OUTCOME_TRY(cursor, space_->cursor());
      OUTCOME_TRY(found, cursor->seekFirst());
      return decodeEntry(found, *cursor);
    }

    /// Entry with the largest key
    outcome::result<std::optional<std::pair<K, V>>> last() const {
      OUTCOME_TRY(cursor, space_->cursor());
      OUTCOME_TRY(found, cursor->seekLast());
      return decodeEntry(found, *cursor);
    }

    /// Number of entries; walks the whole bucket
    outcome::result<size_t> len() const {
      OUTCOME_TRY(cursor, space_->cursor());
      size_t count = 0;
      OUTCOME_TRY(valid, cursor->seekFirst());
      while (valid) {
        ++count;
        OUTCOME_TRY(cursor->next());
        valid = cursor->isValid();
      }
      return count;
    }

    outcome::result<bool> isEmpty() const {
      OUTCOME_TRY(cursor, space_->cursor());
      OUTCOME_TRY(found, cursor->seekFirst());
      return not found;
    }

    /// Atomically remove every entry present at the moment of the call
    outcome::result<void> clear() {
      OUTCOME_TRY(cursor, space_->cursor());
      auto batch = space_->batch();
      OUTCOME_TRY(valid, cursor->seekFirst());
      while (valid) {
        if (auto key = cursor->key()) {
          OUTCOME_TRY(batch->remove(*key));
        }
        OUTCOME_TRY(cursor->next());
        valid = cursor->isValid();
      }
      SL_DEBUG(logger_,
               "clear '{}': {} entries removed",
               space_name_,
               batch->size());
      return batch->commit();
    }

    /// Apply all operations of the batch at once, in their order
    outcome::result<void> apply(const Batch<K, V> &batch) {
      auto raw = space_->batch();
      for (const auto &[key, value] : batch.operations_) {
        if (value.has_value()) {
          OUTCOME_TRY(raw->put(key, qtils::ByteView{*value}));
        } else {
          OUTCOME_TRY(raw->remove(key));
        }
      }
      OUTCOME_TRY(raw->commit());
      SL_TRACE(logger_,
               "batch of {} operations applied to '{}'",
               batch.size(),
               space_name_);
      return outcome::success();
    }

    /// Persist everything written to the store so far
    outcome::result<void> flush() {
      return engine_->flush();
    }

   private:
    static outcome::result<std::optional<V>> decodeOptional(
        const std::optional<qtils::ByteVec> &raw) {
      if (not raw.has_value()) {
        return std::nullopt;
      }
      OUTCOME_TRY(value, Codec<V>::decode(qtils::ByteView{*raw}));
      return std::make_optional(std::move(value));
    }

    static outcome::result<std::optional<qtils::ByteVec>> encodeOptional(
        const std::optional<V> &value) {
      if (not value.has_value()) {
        return std::nullopt;
      }
      OUTCOME_TRY(raw, Codec<V>::encode(*value));
      return std::make_optional(std::move(raw));
    }

    static std::optional<qtils::ByteView> asView(
        const std::optional<qtils::ByteVec> &raw) {
      if (not raw.has_value()) {
        return std::nullopt;
      }
      return qtils::ByteView{*raw};
    }

    static outcome::result<std::optional<std::pair<K, V>>> decodeEntry(
        bool found, const storage::BufferStorageCursor &cursor) {
      if (not found) {
        return std::nullopt;
      }
      auto raw_key = cursor.key();
      auto raw_value = cursor.value();
      if (not raw_key or not raw_value) {
        return std::nullopt;
      }
      OUTCOME_TRY(key, Codec<K>::decode(qtils::ByteView{*raw_key}));
      OUTCOME_TRY(value, Codec<V>::decode(qtils::ByteView{*raw_value}));
      return std::make_optional(std::make_pair(std::move(key), std::move(value)));
    }

    std::optional<std::string> name_;
    std::string space_name_;
    qtils::SharedRef<storage::SpacedStorage> engine_;
    qtils::SharedRef<storage::BufferStorage> space_;
    log::Logger logger_;
  };

}  // namespace kv
