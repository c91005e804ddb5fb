/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace kv::app {

  Configuration::Configuration()
      : database_{
            .directory = "db",
            .read_only = false,
            .temporary = false,
            .use_compression = false,
            .cache_size = 512 << 20,
        },
        transaction_{
            .max_retries = 100,
        } {}

  Configuration::Configuration(DatabaseConfig database,
                               TransactionConfig transaction)
      : database_(std::move(database)), transaction_(transaction) {}

  const Configuration::DatabaseConfig &Configuration::database() const {
    return database_;
  }

  const Configuration::TransactionConfig &Configuration::transaction() const {
    return transaction_;
  }

}  // namespace kv::app
