/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <soralog/logger.hpp>
#include <soralog/macro.hpp>

#include "app/configuration.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(kv::app, Configurator::Error, e) {
  using E = kv::app::Configurator::Error;
  switch (e) {
    case E::CLI_ARGS_PARSE_FAILED:
      return "CLI Arguments parse failed";
    case E::CONFIG_FILE_PARSE_FAILED:
      return "Config file parse failed";
    case E::INVALID_VALUE:
      return "Result config has invalid values";
    case E::CONFIG_FILE_WRITE_FAILED:
      return "Config file write failed";
  }
  return "Unknown Configurator::Error";
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  bool find_argument(boost::program_options::variables_map &vm,
                     const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return true;
      }
    }
    return false;
  }

  /// Reads section[key] into out; reports and leaves out untouched on error
  template <typename T>
  void read_scalar(const YAML::Node &section,
                   std::string_view section_name,
                   const char *key,
                   T &out,
                   std::ostringstream &errors,
                   bool &has_error) {
    auto node = section[key];
    if (not node.IsDefined()) {
      return;
    }
    if (not node.IsScalar()) {
      errors << "E: Value '" << section_name << '.' << key
             << "' must be scalar\n";
      has_error = true;
      return;
    }
    try {
      out = node.as<T>();
    } catch (const YAML::Exception &) {
      errors << "E: Value '" << section_name << '.' << key
             << "' has wrong type: " << node.Scalar() << "\n";
      has_error = true;
    }
  }

  void warn_unknown(const YAML::Node &section,
                    std::string_view section_name,
                    std::initializer_list<std::string_view> known,
                    std::ostringstream &errors) {
    for (auto it = section.begin(); it != section.end(); ++it) {
      auto key = it->first.as<std::string>();
      if (std::ranges::find(known, key) == known.end()) {
        errors << "W: Unknown value '" << section_name
               << (section_name.empty() ? "" : ".") << key << "'\n";
      }
    }
  }

  constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stderr
    thread: none
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: warning
    is_fallback: true
    children:
      - name: kv
        children:
          - name: storage
          - name: app
)yaml";
}  // namespace

namespace kv::app {

  Configurator::Configurator(int argc, const char **argv)
      : argc_(argc), argv_(argv) {
    config_ = std::make_shared<Configuration>();

    namespace po = boost::program_options;

    const auto &db = config_->database_;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("config,c", po::value<std::string>(), "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("bucket,b", po::value<std::string>(), "Bucket to operate on. The default bucket if omitted.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <group>=<level>, e.g., -lstorage=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description storage_options("Storage options");
    storage_options.add_options()
        ("path,p", po::value<std::string>()->default_value(db.directory.native()), "Path to DB directory.")
        ("read-only", "Open the database for reading only.")
        ("temporary", "Remove the database directory on exit.")
        ("compression", "Compress stored data.")
        ("cache-size", po::value<size_t>()->default_value(db.cache_size), "Limit the memory the database cache can use <bytes>.")
        ("max-retries", po::value<size_t>()->default_value(config_->transaction_.max_retries), "Transaction retries on conflict.")
        ;

    po::options_description hidden_options;
    hidden_options.add_options()
        ("command", po::value<std::string>(), "Command to run.")
        ("args", po::value<std::vector<std::string>>(), "Command arguments.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(storage_options)
        .add(hidden_options);
  }

  outcome::result<bool> Configurator::step1() {
    namespace po = boost::program_options;

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(cli_options_)
                                      .positional(positional)
                                      .run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const po::error &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CLI_ARGS_PARSE_FAILED;
    }

    if (cli_values_map_.contains("help")) {
      std::cout << "Usage: kv_tool [options] <command> [args...]\n"
                << "Commands:\n"
                << "  buckets              list buckets\n"
                << "  get <key>            print the value of a key\n"
                << "  set <key> <value>    store a value\n"
                << "  remove <key>         remove a key\n"
                << "  list                 print all entries of the bucket\n\n"
                << cli_options_ << '\n';
      return true;
    }

    find_argument<std::string>(
        cli_values_map_, "command", [&](const std::string &value) {
          command_.name = value;
        });
    find_argument<std::vector<std::string>>(
        cli_values_map_, "args", [&](const std::vector<std::string> &value) {
          command_.args = value;
        });
    find_argument<std::string>(
        cli_values_map_, "bucket", [&](const std::string &value) {
          bucket_ = value;
        });
    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &value) {
          logger_cli_args_ = value;
        });

    if (cli_values_map_.contains("config")) {
      auto path = cli_values_map_["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
        config_path_ = path;
      } catch (const YAML::Exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::CONFIG_FILE_PARSE_FAILED;
      }
    }

    return false;
  }

  outcome::result<YAML::Node> Configurator::getLoggingConfig() const {
    if (config_file_.has_value()) {
      auto logging = (*config_file_)["logging"];
      if (logging.IsDefined()) {
        return logging;
      }
    }
    try {
      return YAML::Load(std::string(default_logging_yaml));
    } catch (const YAML::Exception &e) {
      std::cerr << "Error: Failed to load default logging config: "
                << e.what() << '\n';
      return Error::CONFIG_FILE_PARSE_FAILED;
    }
  }

  outcome::result<std::shared_ptr<Configuration>>
  Configurator::calculateConfig(qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);

    if (config_file_.has_value()) {
      FileReport report;
      applyYaml(*config_file_, *config_, report);
      OUTCOME_TRY(checkReport(report, config_path_.value_or(""), *logger_));
    }

    OUTCOME_TRY(applyCli());
    return config_;
  }

  outcome::result<void> Configurator::applyCli() {
    find_argument<std::string>(
        cli_values_map_, "path", [&](const std::string &value) {
          config_->database_.directory = value;
        });
    if (find_argument(cli_values_map_, "read-only")) {
      config_->database_.read_only = true;
    }
    if (find_argument(cli_values_map_, "temporary")) {
      config_->database_.temporary = true;
    }
    if (find_argument(cli_values_map_, "compression")) {
      config_->database_.use_compression = true;
    }
    find_argument<size_t>(
        cli_values_map_, "cache-size", [&](const size_t &value) {
          config_->database_.cache_size = value;
        });
    find_argument<size_t>(
        cli_values_map_, "max-retries", [&](const size_t &value) {
          config_->transaction_.max_retries = value;
        });

    if (config_->database_.directory.empty()) {
      SL_ERROR(logger_, "The database path must not be empty");
      return Error::INVALID_VALUE;
    }
    if (config_->database_.read_only and config_->database_.temporary) {
      SL_ERROR(logger_, "A read-only database can not be temporary");
      return Error::INVALID_VALUE;
    }
    return outcome::success();
  }

  void Configurator::applyYaml(const YAML::Node &node,
                               Configuration &config,
                               FileReport &report) {
    if (not node.IsMap()) {
      if (not node.IsNull()) {
        report.text << "E: Config document is not a map\n";
        report.has_error = true;
      }
      return;
    }
    warn_unknown(node, "", {"database", "transaction", "logging"}, report.text);

    auto database = node["database"];
    if (database.IsDefined()) {
      if (database.IsMap()) {
        std::string path = config.database_.directory.native();
        read_scalar(database,
                    "database",
                    "path",
                    path,
                    report.text,
                    report.has_error);
        config.database_.directory = path;
        read_scalar(database,
                    "database",
                    "read_only",
                    config.database_.read_only,
                    report.text,
                    report.has_error);
        read_scalar(database,
                    "database",
                    "temporary",
                    config.database_.temporary,
                    report.text,
                    report.has_error);
        read_scalar(database,
                    "database",
                    "use_compression",
                    config.database_.use_compression,
                    report.text,
                    report.has_error);
        read_scalar(database,
                    "database",
                    "cache_size",
                    config.database_.cache_size,
                    report.text,
                    report.has_error);
        warn_unknown(database,
                     "database",
                     {"path",
                      "read_only",
                      "temporary",
                      "use_compression",
                      "cache_size"},
                     report.text);
      } else {
        report.text << "E: Section 'database' defined, but is not map\n";
        report.has_error = true;
      }
    }

    auto transaction = node["transaction"];
    if (transaction.IsDefined()) {
      if (transaction.IsMap()) {
        read_scalar(transaction,
                    "transaction",
                    "max_retries",
                    config.transaction_.max_retries,
                    report.text,
                    report.has_error);
        warn_unknown(transaction, "transaction", {"max_retries"}, report.text);
      } else {
        report.text << "E: Section 'transaction' defined, but is not map\n";
        report.has_error = true;
      }
    }
  }

  outcome::result<void> Configurator::checkReport(const FileReport &report,
                                                  const std::string &source,
                                                  soralog::Logger &logger) {
    std::istringstream iss(report.text.str());
    std::string line;
    while (std::getline(iss, line)) {
      if (line.starts_with("W: ")) {
        logger.warn("Config `{}`: {}", source, std::string_view(line).substr(3));
      } else {
        logger.error("Config `{}`: {}", source, std::string_view(line).substr(3));
      }
    }
    if (report.has_error) {
      return Error::INVALID_VALUE;
    }
    return outcome::success();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::fromYaml(
      const YAML::Node &node, qtils::SharedRef<soralog::Logger> logger) {
    auto config = std::make_shared<Configuration>();
    FileReport report;
    applyYaml(node, *config, report);
    OUTCOME_TRY(checkReport(report, "<yaml>", *logger));
    return config;
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::fromFile(
      const std::filesystem::path &path,
      qtils::SharedRef<soralog::Logger> logger) {
    YAML::Node node;
    try {
      node = YAML::LoadFile(path.native());
    } catch (const YAML::Exception &e) {
      logger->error("Can't parse config file {}: {}", path.native(), e.what());
      return Error::CONFIG_FILE_PARSE_FAILED;
    }
    auto config = std::make_shared<Configuration>();
    FileReport report;
    applyYaml(node, *config, report);
    OUTCOME_TRY(checkReport(report, path.native(), *logger));
    return config;
  }

  YAML::Node Configurator::toYaml(const Configuration &config) {
    YAML::Node node;
    const auto &db = config.database();
    node["database"]["path"] = db.directory.native();
    node["database"]["read_only"] = db.read_only;
    node["database"]["temporary"] = db.temporary;
    node["database"]["use_compression"] = db.use_compression;
    node["database"]["cache_size"] = db.cache_size;
    node["transaction"]["max_retries"] = config.transaction().max_retries;
    return node;
  }

  outcome::result<void> Configurator::saveToFile(
      const Configuration &config, const std::filesystem::path &path) {
    std::ofstream out(path);
    if (not out) {
      return Error::CONFIG_FILE_WRITE_FAILED;
    }
    YAML::Emitter emitter;
    emitter << toYaml(config);
    out << emitter.c_str() << '\n';
    if (not out) {
      return Error::CONFIG_FILE_WRITE_FAILED;
    }
    return outcome::success();
  }

}  // namespace kv::app
