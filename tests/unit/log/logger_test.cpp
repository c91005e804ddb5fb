/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "log/logger.hpp"
#include "testutil/prepare_loggers.hpp"

using kv::log::Error;
using kv::log::Level;

/**
 * @given level names and their short forms
 * @when parsed
 * @then the matching levels are produced, unknown names are rejected
 */
TEST(LoggerTest, LevelNames) {
  ASSERT_OUTCOME_SUCCESS(trace, kv::log::str2lvl("trace"));
  EXPECT_EQ(trace, Level::TRACE);
  ASSERT_OUTCOME_SUCCESS(warn, kv::log::str2lvl("warn"));
  EXPECT_EQ(warn, Level::WARN);
  ASSERT_OUTCOME_SUCCESS(off, kv::log::str2lvl("no"));
  EXPECT_EQ(off, Level::OFF);
  EXPECT_OUTCOME_ERROR(kv::log::str2lvl("loud"), Error::WRONG_LEVEL);
}

/**
 * @given logging system with a storage group
 * @when tuned with a bare level and a group level
 * @then both apply, unknown groups and levels are rejected
 */
TEST(LoggerTest, Tune) {
  auto logsys = testutil::prepareLoggers();
  auto logger = logsys->getLogger("Tune", "storage");

  ASSERT_OUTCOME_SUCCESS(logsys->tuneLoggingSystem({"storage=trace"}));
  EXPECT_EQ(logger->level(), Level::TRACE);

  ASSERT_OUTCOME_SUCCESS(logsys->tuneLoggingSystem({"error"}));
  auto kv_logger = logsys->getLogger("Tune", kv::log::defaultGroupName);
  EXPECT_EQ(kv_logger->level(), Level::ERROR);

  EXPECT_OUTCOME_ERROR(logsys->tuneLoggingSystem({"nowhere=debug"}),
                       Error::WRONG_GROUP);
  EXPECT_OUTCOME_ERROR(logsys->tuneLoggingSystem({"storage=loud"}),
                       Error::WRONG_LEVEL);
  EXPECT_OUTCOME_ERROR(logsys->tuneLoggingSystem({"loud"}),
                       Error::WRONG_LEVEL);

  std::ignore = logsys->resetLevelOfGroup("storage");
  std::ignore = logsys->setLevelOfGroup(kv::log::defaultGroupName, Level::INFO);
}
