/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "app/configuration.hpp"

namespace kv::app {

  class ConfigurationMock : public Configuration {
   public:
    // clang-format off
    MOCK_METHOD(const DatabaseConfig &, database, (), (const, override));
    MOCK_METHOD(const TransactionConfig &, transaction, (), (const, override));
    // clang-format on
  };

}  // namespace kv::app
