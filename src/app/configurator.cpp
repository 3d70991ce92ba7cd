/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <string_view>

#include <boost/assert.hpp>
#include <boost/program_options.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/configuration.hpp"

#ifndef SHARDKV_VERSION
#define SHARDKV_VERSION "undefined"
#endif

OUTCOME_CPP_DEFINE_CATEGORY(shardkv::app, Configurator::Error, e) {
  using E = shardkv::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  return "Unknown app::Configurator::Error";
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    BOOST_ASSERT(nullptr != name);
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  /// Reads scalar `section.name` of the config file, if it is defined
  template <typename T, typename Func>
  void find_value(const YAML::Node &section,
                  std::string_view section_name,
                  const char *name,
                  std::ostringstream &errors,
                  bool &has_error,
                  Func &&f) {
    auto node = section[name];
    if (not node.IsDefined()) {
      return;
    }
    if (not node.IsScalar()) {
      errors << "E: Value '" << section_name << "." << name
             << "' must be scalar\n";
      has_error = true;
      return;
    }
    try {
      std::forward<Func>(f)(node.as<T>());
    } catch (const YAML::BadConversion &) {
      errors << "E: Value '" << section_name << "." << name
             << "' has invalid value\n";
      has_error = true;
    }
  }

  constexpr std::string_view commands_help = R"(Commands:
  get <key>                 read a key
  put <key> <value>         write a key
  cput <key> <value> <exp>  write a key if it holds <exp>; '-' for absent
  inc <key> <delta>         increment an integer key
  scan <from> <to> <max>    read up to <max> rows of [from, to); 0 is no limit
  rscan <from> <to> <max>   same as scan, in reverse order
  del <key>                 delete a key
  delrange <from> <to>      delete all keys of [from, to)
  split <key>               split the range containing <key> at <key>
  merge <key>               merge the range containing <key> with the next one
  ranges                    list ranges with their replicas
Several commands may be given one after another. Put '--' before commands
with negative numbers.)";
}  // namespace

namespace shardkv::app {

  Configurator::Configurator(int argc, const char **argv, const char **env)
      : argc_(argc), argv_(argv), env_(env) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = SHARDKV_VERSION;
    config_->name_ = "shardkv";

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("name,n", po::value<std::string>(), "Set name of the client.")
        ("node-id", po::value<api::NodeId>(), "Gateway node of the client.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lkv_client=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description cluster_options("Cluster options");
    cluster_options.add_options()
        ("nodes", po::value<size_t>(), "Number of nodes of the local cluster.")
        ("replication-factor", po::value<size_t>(), "Number of replicas of each range.")
        ("split-key", po::value<std::vector<std::string>>(), "Initial range boundary. May be repeated.")
        ;

    po::options_description client_options("Client options");
    client_options.add_options()
        ("user-priority", po::value<double>(), "Priority attached to batches which specify none.")
        ("max-retries", po::value<size_t>(), "Limit of transaction restarts; 0 is unbounded.")
        ;

    po::options_description hidden_options;
    hidden_options.add_options()
        ("command", po::value<std::vector<std::string>>(), "Commands to run.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(cluster_options)
        .add(client_options)
        .add(hidden_options);
    cli_positional_.add("command", -1);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::println(std::cout, "shardkv version {}", SHARDKV_VERSION);
      std::println(std::cout,
                   "Usage: shardkv [options] <command> [args] ...");
      std::cout << cli_options_ << '\n';
      std::println(std::cout, "{}", commands_help);
      return true;
    }

    if (vm.contains("version")) {
      std::println(std::cout, "shardkv version {}", SHARDKV_VERSION);
      return true;
    }

    if (vm.contains("config")) {
      config_path_ = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(config_path_);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(config_path_) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(cli_options_)
                                      .positional(cli_positional_)
                                      .run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &value) {
          logger_cli_args_ = value;
        });

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stderr
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: shardkv
        children:
          - name: kv_client
          - name: local_store
          - name: app
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initClusterConfig());
    OUTCOME_TRY(initClientConfig());

    find_argument<std::vector<std::string>>(
        cli_values_map_,
        "command",
        [&](const std::vector<std::string> &value) {
          config_->commands_ = value;
        });

    return config_;
  }

  outcome::result<void> Configurator::checkFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    SL_ERROR(logger_, "Config file `{}` has some problems:", config_path_);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["general"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          find_value<std::string>(section,
                                  "general",
                                  "name",
                                  file_errors_,
                                  file_has_error_,
                                  [&](const std::string &value) {
                                    config_->name_ = value;
                                  });
          find_value<api::NodeId>(section,
                                  "general",
                                  "node-id",
                                  file_errors_,
                                  file_has_error_,
                                  [&](api::NodeId value) {
                                    config_->node_id_ = value;
                                  });
        } else {
          file_errors_ << "E: Section 'general' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }
    OUTCOME_TRY(checkFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          config_->name_ = value;
        });
    find_argument<api::NodeId>(
        cli_values_map_, "node-id", [&](api::NodeId value) {
          config_->node_id_ = value;
        });

    // Check values
    if (config_->node_id_ < 1) {
      SL_ERROR(logger_,
               "The 'node-id' must be positive: {}",
               config_->node_id_);
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initClusterConfig() {
    auto &cluster = config_->cluster_;

    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["cluster"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          find_value<size_t>(section,
                             "cluster",
                             "nodes",
                             file_errors_,
                             file_has_error_,
                             [&](size_t value) { cluster.nodes = value; });
          find_value<size_t>(
              section,
              "cluster",
              "replication-factor",
              file_errors_,
              file_has_error_,
              [&](size_t value) { cluster.replication_factor = value; });
          auto split_keys = section["split-keys"];
          if (split_keys.IsDefined()) {
            if (split_keys.IsSequence()) {
              for (auto key : split_keys) {
                if (key.IsScalar()) {
                  cluster.split_keys.push_back(key.as<std::string>());
                } else {
                  file_errors_
                      << "E: Items of 'cluster.split-keys' must be scalar\n";
                  file_has_error_ = true;
                }
              }
            } else {
              file_errors_ << "E: Value 'cluster.split-keys' must be list\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'cluster' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }
    OUTCOME_TRY(checkFileErrors());

    // Adjust by CLI arguments
    find_argument<size_t>(cli_values_map_, "nodes", [&](size_t value) {
      cluster.nodes = value;
    });
    find_argument<size_t>(
        cli_values_map_, "replication-factor", [&](size_t value) {
          cluster.replication_factor = value;
        });
    find_argument<std::vector<std::string>>(
        cli_values_map_,
        "split-key",
        [&](const std::vector<std::string> &value) {
          cluster.split_keys = value;
        });

    // Check values
    if (cluster.nodes == 0) {
      SL_ERROR(logger_, "The cluster must have at least one node");
      return Error::InvalidValue;
    }
    if (cluster.replication_factor == 0
        or cluster.replication_factor > cluster.nodes) {
      SL_ERROR(logger_,
               "The 'replication-factor' must be in [1, {}]: {}",
               cluster.nodes,
               cluster.replication_factor);
      return Error::InvalidValue;
    }
    if (static_cast<size_t>(config_->node_id_) > cluster.nodes) {
      SL_ERROR(logger_,
               "The 'node-id' {} is not a node of the cluster",
               config_->node_id_);
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initClientConfig() {
    auto &client = config_->client_;
    auto &retry = client.txn_retry;

    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["client"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          find_value<double>(
              section,
              "client",
              "user-priority",
              file_errors_,
              file_has_error_,
              [&](double value) { client.user_priority = value; });
          find_value<uint64_t>(section,
                               "client",
                               "initial-backoff-ms",
                               file_errors_,
                               file_has_error_,
                               [&](uint64_t value) {
                                 retry.initial_backoff =
                                     std::chrono::milliseconds(value);
                               });
          find_value<uint64_t>(section,
                               "client",
                               "max-backoff-ms",
                               file_errors_,
                               file_has_error_,
                               [&](uint64_t value) {
                                 retry.max_backoff =
                                     std::chrono::milliseconds(value);
                               });
          find_value<double>(section,
                             "client",
                             "multiplier",
                             file_errors_,
                             file_has_error_,
                             [&](double value) { retry.multiplier = value; });
          find_value<size_t>(section,
                             "client",
                             "max-retries",
                             file_errors_,
                             file_has_error_,
                             [&](size_t value) { retry.max_retries = value; });
        } else {
          file_errors_ << "E: Section 'client' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }
    OUTCOME_TRY(checkFileErrors());

    // Adjust by CLI arguments
    find_argument<double>(cli_values_map_, "user-priority", [&](double value) {
      client.user_priority = value;
    });
    find_argument<size_t>(cli_values_map_, "max-retries", [&](size_t value) {
      retry.max_retries = value;
    });

    // Check values
    if (client.user_priority < api::kMinUserPriority
        or client.user_priority > api::kMaxUserPriority) {
      SL_ERROR(logger_,
               "The 'user-priority' must be in [{}, {}]: {}",
               api::kMinUserPriority,
               api::kMaxUserPriority,
               client.user_priority);
      return Error::InvalidValue;
    }
    if (retry.multiplier < 1) {
      SL_ERROR(logger_,
               "The backoff 'multiplier' must not be less than 1: {}",
               retry.multiplier);
      return Error::InvalidValue;
    }
    if (retry.initial_backoff > retry.max_backoff) {
      SL_ERROR(logger_,
               "The 'initial-backoff-ms' exceeds 'max-backoff-ms'");
      return Error::InvalidValue;
    }

    return outcome::success();
  }

}  // namespace shardkv::app
