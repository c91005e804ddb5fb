/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <type_traits>

#include <qtils/shared_ref.hpp>

#include "kv/bucket.hpp"
#include "kv/transaction.hpp"
#include "log/logger.hpp"
#include "storage/spaced_storage.hpp"

namespace kv::app {
  class Configuration;
}

namespace kv {

  /**
   * @brief Owner of the engine and the bucket namespace.
   *
   * Thread safe: buckets and transactions may be used from several threads
   * at once, isolation is provided by the engine.
   */
  class Store {
   public:
    Store(qtils::SharedRef<log::LoggingSystem> logsys,
          qtils::SharedRef<app::Configuration> config,
          qtils::SharedRef<storage::SpacedStorage> engine);

    /// Persistent store on RocksDB in the configured directory
    static outcome::result<std::shared_ptr<Store>> open(
        qtils::SharedRef<log::LoggingSystem> logsys,
        qtils::SharedRef<app::Configuration> config);

    /// Store kept in memory, gone with the last reference
    static std::shared_ptr<Store> inMemory(
        qtils::SharedRef<log::LoggingSystem> logsys,
        qtils::SharedRef<app::Configuration> config);

    /**
     * Open a bucket, creating it if needed. std::nullopt (or "default")
     * selects the default bucket; an empty name is invalid.
     */
    template <Key K, Value V>
    outcome::result<Bucket<K, V>> bucket(
        std::optional<std::string> name = std::nullopt) {
      OUTCOME_TRY(space, openSpace(name));
      return Bucket<K, V>{std::move(name), engine_, space, bucket_logger_};
    }

    /// Names of existing buckets, the default one included
    outcome::result<std::vector<std::string>> buckets() const;

    /**
     * Remove a bucket with all its entries
     * @return false if there was no such bucket
     */
    outcome::result<bool> dropBucket(std::string_view name);

    /**
     * Run body inside a transaction, again and again while it conflicts
     * with concurrent modifications, at most max_retries extra times.
     * Body must return outcome::result<T>; it is run from the start on
     * every retry, so it must not keep side effects between runs.
     * @return the body's result when committed, the abort reason when
     * aborted, TransactionError::RETRIES_EXHAUSTED when the retries ran out,
     * or the first error which is not a conflict
     */
    template <typename F>
    auto transaction(F &&body) -> std::invoke_result_t<F &, Transaction &> {
      using Result = std::invoke_result_t<F &, Transaction &>;
      const auto max_retries = maxRetries();
      for (size_t attempt = 0; attempt <= max_retries; ++attempt) {
        OUTCOME_TRY(txn, engine_->beginTransaction());
        Transaction tx{std::move(txn), logger_};
        Result res = body(tx);
        OUTCOME_TRY(committed,
                    tx.complete(res.has_error()
                                    ? std::make_optional(res.error())
                                    : std::nullopt));
        if (committed) {
          return res;
        }
        SL_DEBUG(logger_,
                 "Transaction conflicted, retry {} of {}",
                 attempt + 1,
                 max_retries);
      }
      SL_WARN(logger_,
              "Transaction still conflicts after {} retries",
              max_retries);
      return TransactionError::RETRIES_EXHAUSTED;
    }

    /// Persist everything written so far
    outcome::result<void> flush();

    qtils::SharedRef<storage::SpacedStorage> engine() const {
      return engine_;
    }

   private:
    outcome::result<std::shared_ptr<storage::BufferStorage>> openSpace(
        const std::optional<std::string> &name);

    size_t maxRetries() const;

    qtils::SharedRef<app::Configuration> config_;
    qtils::SharedRef<storage::SpacedStorage> engine_;
    log::Logger logger_;
    log::Logger bucket_logger_;
  };

}  // namespace kv
