/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <type_traits>

#include "kv/bucket.hpp"
#include "kv/transaction_error.hpp"
#include "log/logger.hpp"
#include "storage/spaced_storage.hpp"
#include "utils/ctor_limiters.hpp"

namespace kv {

  /**
   * @brief Unit of atomic work over any buckets of one store.
   *
   * Created by Store::transaction() for one run of the body. Reads and
   * writes go through the engine transaction: nothing is visible to others
   * until the body returns successfully and the commit succeeds.
   */
  class Transaction : NonCopyable, NonMovable {
   public:
    enum class State : uint8_t {
      Running,
      Committed,
      Aborted,
      ConflictRetry,
    };

    Transaction(std::unique_ptr<storage::SpacedTransaction> txn,
                log::Logger logger);

    ~Transaction();

    // key and value types come from the bucket alone, so "alice" works for
    // a bucket of std::string keys
    template <Key K, Value V>
    outcome::result<std::optional<V>> get(const Bucket<K, V> &bucket,
                                          const std::type_identity_t<K> &key) {
      OUTCOME_TRY(ensureRunning());
      OUTCOME_TRY(raw_key, Codec<K>::encode(key));
      OUTCOME_TRY(raw, txn_->tryGet(bucket.spaceName(), raw_key));
      return decodeOptional<V>(raw);
    }

    /// @return the value replaced, if there was one
    template <Key K, Value V>
    outcome::result<std::optional<V>> set(
        const Bucket<K, V> &bucket,
        const std::type_identity_t<K> &key,
        const std::type_identity_t<V> &value) {
      OUTCOME_TRY(ensureRunning());
      OUTCOME_TRY(raw_key, Codec<K>::encode(key));
      OUTCOME_TRY(raw_value, Codec<V>::encode(value));
      OUTCOME_TRY(previous, txn_->tryGet(bucket.spaceName(), raw_key));
      OUTCOME_TRY(txn_->put(
          bucket.spaceName(), raw_key, qtils::ByteView{raw_value}));
      return decodeOptional<V>(previous);
    }

    /// @return the value removed, if there was one
    template <Key K, Value V>
    outcome::result<std::optional<V>> remove(
        const Bucket<K, V> &bucket, const std::type_identity_t<K> &key) {
      OUTCOME_TRY(ensureRunning());
      OUTCOME_TRY(raw_key, Codec<K>::encode(key));
      OUTCOME_TRY(previous, txn_->tryGet(bucket.spaceName(), raw_key));
      if (previous.has_value()) {
        OUTCOME_TRY(txn_->remove(bucket.spaceName(), raw_key));
      }
      return decodeOptional<V>(previous);
    }

    template <Key K, Value V>
    outcome::result<bool> contains(const Bucket<K, V> &bucket,
                                   const std::type_identity_t<K> &key) {
      OUTCOME_TRY(ensureRunning());
      OUTCOME_TRY(raw_key, Codec<K>::encode(key));
      OUTCOME_TRY(raw, txn_->tryGet(bucket.spaceName(), raw_key));
      return raw.has_value();
    }

    /**
     * Stop without committing and without retrying. The body is expected
     * to return the result of this call:
     *   return tx.abort(MyError::NOT_ENOUGH_FUNDS);
     * @return reason, which becomes the result of Store::transaction()
     */
    std::error_code abort(std::error_code reason);

    template <typename E>
      requires std::is_error_code_enum_v<E>
    std::error_code abort(E reason) {
      return abort(make_error_code(reason));
    }

    /// Abort with TransactionError::ABORTED
    std::error_code abort();

    State state() const {
      return state_;
    }

    /**
     * Conclude a run of the body. Commits when the body succeeded.
     * @return true when committed, false when the body must run again,
     * error when the transaction failed for good
     */
    outcome::result<bool> complete(
        const std::optional<std::error_code> &body_error);

   private:
    outcome::result<void> ensureRunning() const;

    template <Value V>
    static outcome::result<std::optional<V>> decodeOptional(
        const std::optional<qtils::ByteVec> &raw) {
      if (not raw.has_value()) {
        return std::nullopt;
      }
      OUTCOME_TRY(value, Codec<V>::decode(qtils::ByteView{*raw}));
      return std::make_optional(std::move(value));
    }

    std::unique_ptr<storage::SpacedTransaction> txn_;
    log::Logger logger_;
    State state_ = State::Running;
    std::optional<std::error_code> abort_reason_;
  };

}  // namespace kv
