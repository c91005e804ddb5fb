/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <sstream>

#include <boost/program_options.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <yaml-cpp/yaml.h>

namespace soralog {
  class Logger;
}  // namespace soralog

namespace kv::app {
  class Configuration;
}  // namespace kv::app

namespace kv::app {

  /**
   * Builds Configuration from a YAML config file and command line options.
   * Command line values override the file.
   */
  class Configurator final {
   public:
    enum class Error : uint8_t {
      CLI_ARGS_PARSE_FAILED = 1,
      CONFIG_FILE_PARSE_FAILED,
      INVALID_VALUE,
      CONFIG_FILE_WRITE_FAILED,
    };

    /// Positional part of the command line
    struct Command {
      std::string name;
      std::vector<std::string> args;
    };

    Configurator() = delete;
    Configurator(Configurator &&) noexcept = delete;
    Configurator(const Configurator &) = delete;
    ~Configurator() = default;
    Configurator &operator=(Configurator &&) noexcept = delete;
    Configurator &operator=(const Configurator &) = delete;

    Configurator(int argc, const char **argv);

    /**
     * Parse CLI args and load the config file if one is given
     * @return true if the program should exit (help was printed)
     */
    outcome::result<bool> step1();

    outcome::result<YAML::Node> getLoggingConfig() const;

    const std::vector<std::string> &getLoggingCliArgs() const {
      return logger_cli_args_;
    }

    const Command &command() const {
      return command_;
    }

    /// Bucket selected with --bucket, std::nullopt for the default one
    const std::optional<std::string> &bucket() const {
      return bucket_;
    }

    outcome::result<std::shared_ptr<Configuration>> calculateConfig(
        qtils::SharedRef<soralog::Logger> logger);

    /// Configuration from a YAML document without any command line
    static outcome::result<std::shared_ptr<Configuration>> fromYaml(
        const YAML::Node &node, qtils::SharedRef<soralog::Logger> logger);

    static outcome::result<std::shared_ptr<Configuration>> fromFile(
        const std::filesystem::path &path,
        qtils::SharedRef<soralog::Logger> logger);

    static YAML::Node toYaml(const Configuration &config);

    static outcome::result<void> saveToFile(const Configuration &config,
                                            const std::filesystem::path &path);

   private:
    struct FileReport {
      std::ostringstream text;
      bool has_error = false;
    };

    static void applyYaml(const YAML::Node &node,
                          Configuration &config,
                          FileReport &report);

    static outcome::result<void> checkReport(const FileReport &report,
                                             const std::string &source,
                                             soralog::Logger &logger);

    outcome::result<void> applyCli();

    int argc_;
    const char **argv_;

    std::shared_ptr<Configuration> config_;
    std::shared_ptr<soralog::Logger> logger_;

    std::optional<std::string> config_path_;
    std::optional<YAML::Node> config_file_;
    std::vector<std::string> logger_cli_args_;
    Command command_;
    std::optional<std::string> bucket_;

    boost::program_options::options_description cli_options_;
    boost::program_options::variables_map cli_values_map_;
  };

}  // namespace kv::app

OUTCOME_HPP_DECLARE_ERROR(kv::app, Configurator::Error);
