/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <filesystem>

namespace kv::app {

  class Configuration {
   public:
    struct DatabaseConfig {
      std::filesystem::path directory = "db";
      bool read_only = false;
      /// Remove the directory when the engine is closed
      bool temporary = false;
      bool use_compression = false;
      size_t cache_size = 512 << 20;  // 512MiB
    };

    struct TransactionConfig {
      /// How many times a conflicting transaction body is run again
      size_t max_retries = 100;
    };

    Configuration();
    Configuration(DatabaseConfig database, TransactionConfig transaction);
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const DatabaseConfig &database() const;

    [[nodiscard]] virtual const TransactionConfig &transaction() const;

   private:
    friend class Configurator;  // for external configure

    DatabaseConfig database_;
    TransactionConfig transaction_;
  };

}  // namespace kv::app
