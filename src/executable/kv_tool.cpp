/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <memory>
#include <string>

#include <fmt/format.h>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "kv/store.hpp"
#include "log/logger.hpp"

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }

  using kv::Store;
  using kv::app::Configurator;
  using TextBucket = kv::Bucket<std::string, std::string>;

  bool expect_args(const Configurator::Command &command, size_t count) {
    if (command.args.size() != count) {
      std::cerr << fmt::format("Command `{}` takes {} argument(s), got {}\n",
                               command.name,
                               count,
                               command.args.size());
      return false;
    }
    return true;
  }

  int run_command(Store &store,
                  const Configurator::Command &command,
                  const std::optional<std::string> &bucket_name) {
    if (command.name == "buckets") {
      auto names = store.buckets();
      if (names.has_error()) {
        std::cerr << fmt::format("Can't list buckets: {}\n",
                                 names.error().message());
        return EXIT_FAILURE;
      }
      for (auto &name : names.value()) {
        std::cout << name << '\n';
      }
      return EXIT_SUCCESS;
    }

    auto bucket_res = store.bucket<std::string, std::string>(bucket_name);
    if (bucket_res.has_error()) {
      std::cerr << fmt::format("Can't open bucket: {}\n",
                               bucket_res.error().message());
      return EXIT_FAILURE;
    }
    TextBucket &bucket = bucket_res.value();

    if (command.name == "get") {
      if (not expect_args(command, 1)) {
        return EXIT_FAILURE;
      }
      auto value = bucket.get(command.args[0]);
      if (value.has_error()) {
        std::cerr << fmt::format("Can't get: {}\n", value.error().message());
        return EXIT_FAILURE;
      }
      if (not value.value().has_value()) {
        std::cerr << "Not found\n";
        return EXIT_FAILURE;
      }
      std::cout << *value.value() << '\n';
      return EXIT_SUCCESS;
    }

    if (command.name == "set") {
      if (not expect_args(command, 2)) {
        return EXIT_FAILURE;
      }
      auto previous = bucket.set(command.args[0], command.args[1]);
      if (previous.has_error()) {
        std::cerr << fmt::format("Can't set: {}\n",
                                 previous.error().message());
        return EXIT_FAILURE;
      }
      if (previous.value().has_value()) {
        std::cout << fmt::format("replaced: {}\n", *previous.value());
      }
      return EXIT_SUCCESS;
    }

    if (command.name == "remove") {
      if (not expect_args(command, 1)) {
        return EXIT_FAILURE;
      }
      auto previous = bucket.remove(command.args[0]);
      if (previous.has_error()) {
        std::cerr << fmt::format("Can't remove: {}\n",
                                 previous.error().message());
        return EXIT_FAILURE;
      }
      if (not previous.value().has_value()) {
        std::cerr << "Not found\n";
        return EXIT_FAILURE;
      }
      return EXIT_SUCCESS;
    }

    if (command.name == "list") {
      if (not expect_args(command, 0)) {
        return EXIT_FAILURE;
      }
      auto iter = bucket.iter();
      while (true) {
        auto item = iter.next();
        if (item.has_error()) {
          std::cerr << fmt::format("Iteration failed: {}\n",
                                   item.error().message());
          return EXIT_FAILURE;
        }
        if (not item.value().has_value()) {
          break;
        }
        auto key = item.value()->key();
        auto value = item.value()->value();
        std::cout << fmt::format(
            "{} = {}\n",
            key.has_value() ? key.value() : "<" + key.error().message() + ">",
            value.has_value() ? value.value()
                              : "<" + value.error().message() + ">");
      }
      return EXIT_SUCCESS;
    }

    wrong_usage();
    return EXIT_FAILURE;
  }
}  // namespace

int main(int argc, const char **argv) {
  auto app_configurator = std::make_unique<Configurator>(argc, argv);

  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  if (app_configurator->command().name.empty()) {
    wrong_usage();
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto log_config = app_configurator->getLoggingConfig();
  if (log_config.has_error()) {
    std::cerr << "Logging config is empty.\n";
    return EXIT_FAILURE;
  }

  auto log_configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
      std::shared_ptr<soralog::Configurator>(nullptr), log_config.value());

  auto soralog_system =
      std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

  auto config_result = soralog_system->configure();
  if (not config_result.message.empty()) {
    (config_result.has_error ? std::cerr : std::cout)
        << config_result.message << '\n';
  }
  if (config_result.has_error) {
    return EXIT_FAILURE;
  }

  auto logging_system =
      std::make_shared<kv::log::LoggingSystem>(std::move(soralog_system));

  if (auto res = logging_system->tuneLoggingSystem(
          app_configurator->getLoggingCliArgs());
      res.has_error()) {
    std::cerr << fmt::format("Wrong logging filter: {}\n",
                             res.error().message());
    return EXIT_FAILURE;
  }

  auto logger = logging_system->getLogger("Main", kv::log::defaultGroupName);

  // Setup config
  auto config_res = app_configurator->calculateConfig(
      logging_system->getLogger("Configurator", kv::log::defaultGroupName));
  if (config_res.has_error()) {
    SL_CRITICAL(logger,
                "Failed to calculate config: {}",
                config_res.error().message());
    std::cerr << fmt::format("Failed to calculate config: {}\n",
                             config_res.error().message());
    return EXIT_FAILURE;
  }
  auto app_configuration = config_res.value();

  auto store = Store::open(logging_system, app_configuration);
  if (store.has_error()) {
    SL_CRITICAL(logger, "Failed to open store: {}", store.error().message());
    std::cerr << fmt::format("Failed to open store in {}: {}\n",
                             app_configuration->database().directory.native(),
                             store.error().message());
    return EXIT_FAILURE;
  }

  auto exit_code = run_command(
      *store.value(), app_configurator->command(), app_configurator->bucket());

  if (auto res = store.value()->flush(); res.has_error()) {
    SL_ERROR(logger, "Flush failed: {}", res.error().message());
    exit_code = EXIT_FAILURE;
  }
  logger->flush();

  return exit_code;
}
