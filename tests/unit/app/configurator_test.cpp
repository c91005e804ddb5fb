/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <fstream>

#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/storage/base_fs_test.hpp"

using kv::app::Configuration;
using kv::app::Configurator;

class ConfiguratorTest : public test::BaseFS_Test {
 public:
  ConfiguratorTest() : BaseFS_Test("/tmp/kv-test-configurator") {}

  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  std::shared_ptr<soralog::Logger> log =
      testutil::prepareLoggers()->getLogger("Configurator", "testing");
};

/**
 * @given no options
 * @when the configuration is calculated
 * @then defaults are used
 */
TEST_F(ConfiguratorTest, Defaults) {
  const char *argv[] = {"kv_tool"};
  Configurator configurator(1, argv);
  ASSERT_OUTCOME_SUCCESS(exit, configurator.step1());
  EXPECT_FALSE(exit);
  ASSERT_OUTCOME_SUCCESS(config, configurator.calculateConfig(log));

  Configuration defaults;
  EXPECT_EQ(config->database().directory, defaults.database().directory);
  EXPECT_FALSE(config->database().read_only);
  EXPECT_FALSE(config->database().temporary);
  EXPECT_FALSE(config->database().use_compression);
  EXPECT_EQ(config->database().cache_size, 512 << 20);
  EXPECT_EQ(config->transaction().max_retries, 100);
  EXPECT_TRUE(configurator.command().name.empty());
  EXPECT_EQ(configurator.bucket(), std::nullopt);
}

/**
 * @given command line with storage options, a bucket and a command
 * @when parsed
 * @then every value lands in the configuration or the command
 */
TEST_F(ConfiguratorTest, CommandLine) {
  const char *argv[] = {"kv_tool",
                        "--path",
                        "/tmp/elsewhere",
                        "--compression",
                        "--cache-size",
                        "1024",
                        "--max-retries",
                        "5",
                        "-b",
                        "users",
                        "-lstorage=debug",
                        "set",
                        "alice",
                        "42"};
  Configurator configurator(static_cast<int>(std::size(argv)), argv);
  ASSERT_OUTCOME_SUCCESS(exit, configurator.step1());
  EXPECT_FALSE(exit);
  ASSERT_OUTCOME_SUCCESS(config, configurator.calculateConfig(log));

  EXPECT_EQ(config->database().directory, "/tmp/elsewhere");
  EXPECT_TRUE(config->database().use_compression);
  EXPECT_EQ(config->database().cache_size, 1024);
  EXPECT_EQ(config->transaction().max_retries, 5);
  EXPECT_EQ(configurator.bucket(), std::make_optional<std::string>("users"));
  EXPECT_EQ(configurator.command().name, "set");
  EXPECT_EQ(configurator.command().args,
            (std::vector<std::string>{"alice", "42"}));
  EXPECT_EQ(configurator.getLoggingCliArgs(),
            std::vector<std::string>{"storage=debug"});
}

/**
 * @given --help
 * @when parsed
 * @then the caller is told to exit
 */
TEST_F(ConfiguratorTest, Help) {
  const char *argv[] = {"kv_tool", "--help"};
  Configurator configurator(2, argv);
  ASSERT_OUTCOME_SUCCESS(exit, configurator.step1());
  EXPECT_TRUE(exit);
}

/**
 * @given unknown option
 * @when parsed
 * @then parsing fails
 */
TEST_F(ConfiguratorTest, UnknownOption) {
  const char *argv[] = {"kv_tool", "--no-such-option"};
  Configurator configurator(2, argv);
  EXPECT_OUTCOME_ERROR(configurator.step1(),
                       Configurator::Error::CLI_ARGS_PARSE_FAILED);
}

/**
 * @given read-only and temporary together
 * @when the configuration is calculated
 * @then it is rejected
 */
TEST_F(ConfiguratorTest, ReadOnlyTemporaryConflict) {
  const char *argv[] = {"kv_tool", "--read-only", "--temporary"};
  Configurator configurator(3, argv);
  ASSERT_OUTCOME_SUCCESS(configurator.step1());
  EXPECT_OUTCOME_ERROR(configurator.calculateConfig(log),
                       Configurator::Error::INVALID_VALUE);
}

/**
 * @given YAML document with both sections and an unknown key
 * @when a configuration is built from it
 * @then known values are applied and the unknown key is only a warning
 */
TEST_F(ConfiguratorTest, FromYaml) {
  auto node = YAML::Load(R"(
database:
  path: /var/lib/kv
  read_only: true
  cache_size: 4096
  colour: blue
transaction:
  max_retries: 3
)");
  ASSERT_OUTCOME_SUCCESS(config, Configurator::fromYaml(node, log));
  EXPECT_EQ(config->database().directory, "/var/lib/kv");
  EXPECT_TRUE(config->database().read_only);
  EXPECT_EQ(config->database().cache_size, 4096);
  EXPECT_EQ(config->transaction().max_retries, 3);
}

/**
 * @given YAML documents with values of the wrong type or shape
 * @when configurations are built from them
 * @then they are rejected
 */
TEST_F(ConfiguratorTest, FromYamlInvalid) {
  EXPECT_OUTCOME_ERROR(
      Configurator::fromYaml(YAML::Load("database: {cache_size: lots}"), log),
      Configurator::Error::INVALID_VALUE);
  EXPECT_OUTCOME_ERROR(
      Configurator::fromYaml(YAML::Load("transaction: [1, 2]"), log),
      Configurator::Error::INVALID_VALUE);
  EXPECT_OUTCOME_ERROR(Configurator::fromYaml(YAML::Load("- a\n- b"), log),
                       Configurator::Error::INVALID_VALUE);
}

/**
 * @given configuration saved to a file
 * @when the file is loaded
 * @then the same values are read
 */
TEST_F(ConfiguratorTest, SaveAndLoad) {
  Configuration config{{.directory = "/data/kv",
                        .read_only = false,
                        .temporary = true,
                        .use_compression = true,
                        .cache_size = 1 << 20},
                       {.max_retries = 9}};
  auto path = base_path / "config.yaml";
  ASSERT_OUTCOME_SUCCESS(Configurator::saveToFile(config, path));

  ASSERT_OUTCOME_SUCCESS(loaded, Configurator::fromFile(path, log));
  EXPECT_EQ(loaded->database().directory, "/data/kv");
  EXPECT_TRUE(loaded->database().temporary);
  EXPECT_TRUE(loaded->database().use_compression);
  EXPECT_EQ(loaded->database().cache_size, 1 << 20);
  EXPECT_EQ(loaded->transaction().max_retries, 9);

  EXPECT_OUTCOME_ERROR(Configurator::fromFile(base_path / "missing.yaml", log),
                       Configurator::Error::CONFIG_FILE_PARSE_FAILED);
  EXPECT_OUTCOME_ERROR(
      Configurator::saveToFile(config, base_path / "no" / "dir.yaml"),
      Configurator::Error::CONFIG_FILE_WRITE_FAILED);
}

/**
 * @given config file and a command line option for the same value
 * @when the configuration is calculated
 * @then the command line wins, other file values are kept
 */
TEST_F(ConfiguratorTest, CommandLineOverridesFile) {
  auto path = (base_path / "kv.yaml").native();
  {
    std::ofstream file(path);
    file << "database:\n  path: /from/file\n"
            "transaction:\n  max_retries: 1\n";
  }
  const char *argv[] = {
      "kv_tool", "--config", path.c_str(), "--max-retries", "7", "list"};
  Configurator configurator(static_cast<int>(std::size(argv)), argv);
  ASSERT_OUTCOME_SUCCESS(configurator.step1());
  ASSERT_OUTCOME_SUCCESS(config, configurator.calculateConfig(log));
  EXPECT_EQ(config->database().directory, "/from/file");
  EXPECT_EQ(config->transaction().max_retries, 7);
  EXPECT_EQ(configurator.command().name, "list");

  ASSERT_OUTCOME_SUCCESS(logging, configurator.getLoggingConfig());
  EXPECT_TRUE(logging["groups"].IsDefined());
}

/**
 * @given --config naming a file which does not exist
 * @when parsed
 * @then parsing fails
 */
TEST_F(ConfiguratorTest, MissingConfigFile) {
  auto path = (base_path / "absent.yaml").native();
  const char *argv[] = {"kv_tool", "--config", path.c_str()};
  Configurator configurator(3, argv);
  EXPECT_OUTCOME_ERROR(configurator.step1(),
                       Configurator::Error::CONFIG_FILE_PARSE_FAILED);
}
