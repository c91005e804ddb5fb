/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "kv/store.hpp"
#include "mock/app/configuration_mock.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/storage/base_fs_test.hpp"

namespace test {

  enum class Engine : uint8_t { InMemory, RocksDb };

  inline std::string engineName(
      const testing::TestParamInfo<Engine> &info) {
    return info.param == Engine::InMemory ? "InMemory" : "RocksDb";
  }

  /**
   * Fixture running the same test against every engine. The RocksDB store
   * lives in a scratch directory removed after each test.
   */
  struct BaseStore_Test : public BaseFS_Test,
                          public testing::WithParamInterface<Engine> {
    BaseStore_Test() : BaseFS_Test("/tmp/kv-test-store") {}

    static void SetUpTestCase() {
      testutil::prepareLoggers();
    }

    void SetUp() override {
      BaseFS_Test::SetUp();
      logsys = testutil::prepareLoggers();
      app_config = std::make_shared<kv::app::ConfigurationMock>();

      db_config = {
          .directory = getPathString() + "/db",
          .cache_size = 8 << 20,  // 8Mb
      };
      EXPECT_CALL(*app_config, database())
          .WillRepeatedly(testing::ReturnRef(db_config));
      EXPECT_CALL(*app_config, transaction())
          .WillRepeatedly(testing::ReturnRef(txn_config));

      open();
    }

    void TearDown() override {
      store.reset();
      app_config.reset();
      BaseFS_Test::TearDown();
    }

    void open() {
      store.reset();
      if (GetParam() == Engine::InMemory) {
        store = kv::Store::inMemory(logsys, app_config);
        return;
      }
      auto opened = kv::Store::open(logsys, app_config);
      ASSERT_TRUE(opened.has_value())
          << "BaseStore_Test: " << opened.error().message();
      store = opened.value();
    }

    std::shared_ptr<kv::log::LoggingSystem> logsys;
    std::shared_ptr<kv::app::ConfigurationMock> app_config;
    kv::app::Configuration::DatabaseConfig db_config;
    kv::app::Configuration::TransactionConfig txn_config;
    std::shared_ptr<kv::Store> store;
  };

}  // namespace test
