/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testutil/storage/base_fs_test.hpp"

namespace test {

  BaseFS_Test::BaseFS_Test(fs::path path)
      : base_path(std::move(path)),
        logger(testutil::prepareLoggers()->getLogger("BaseFS_Test",
                                                     "testing")) {
    clear();
    mkdir();
  }

  BaseFS_Test::~BaseFS_Test() {
    clear();
  }

  void BaseFS_Test::clear() {
    std::error_code ec;
    fs::remove_all(base_path, ec);
    if (ec) {
      SL_WARN(logger, "Can't remove {}: {}", base_path.native(), ec.message());
    }
  }

  void BaseFS_Test::mkdir() {
    std::error_code ec;
    fs::create_directories(base_path, ec);
    ASSERT_FALSE(ec) << "Can't create " << base_path << ": " << ec.message();
  }

  std::string BaseFS_Test::getPathString() const {
    return base_path.native();
  }

  void BaseFS_Test::SetUp() {
    clear();
    mkdir();
  }

  void BaseFS_Test::TearDown() {
    clear();
  }

}  // namespace test
