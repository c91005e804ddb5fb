/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include <filesystem>

#include "log/logger.hpp"
#include "testutil/prepare_loggers.hpp"

namespace test {

  namespace fs = std::filesystem;

  /**
   * Fixture owning a scratch directory: created empty before each test and
   * removed after it.
   */
  struct BaseFS_Test : public ::testing::Test {
    explicit BaseFS_Test(fs::path path);

    ~BaseFS_Test() override;

    void clear();

    void mkdir();

    std::string getPathString() const;

    void SetUp() override;

    void TearDown() override;

   protected:
    fs::path base_path;
    kv::log::Logger logger;
  };

}  // namespace test
