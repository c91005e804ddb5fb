/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testutil/storage/base_rocksdb_test.hpp"

#include "storage/spaces.hpp"

namespace test {

  void BaseRocksDB_Test::open() {
    db_.reset();
    rocks_.reset();

    auto rocks = RocksDB::create(logsys, app_config);
    ASSERT_TRUE(rocks.has_value())
        << "BaseRocksDB_Test: " << rocks.error().message();
    rocks_ = rocks.value();

    auto space = rocks_->getSpace(kv::storage::kDefaultSpaceName);
    ASSERT_TRUE(space.has_value())
        << "BaseRocksDB_Test: " << space.error().message();
    db_ = space.value();
  }

  BaseRocksDB_Test::BaseRocksDB_Test(fs::path path)
      : BaseFS_Test(std::move(path)) {}

  void BaseRocksDB_Test::SetUp() {
    BaseFS_Test::SetUp();
    logsys = testutil::prepareLoggers();
    app_config = std::make_shared<kv::app::ConfigurationMock>();

    db_config = {
        .directory = getPathString() + "/db",
        .cache_size = 8 << 20,  // 8Mb
    };
    EXPECT_CALL(*app_config, database())
        .WillRepeatedly(testing::ReturnRef(db_config));

    open();
  }

  void BaseRocksDB_Test::TearDown() {
    db_.reset();
    rocks_.reset();
    app_config.reset();
    clear();
  }

}  // namespace test
