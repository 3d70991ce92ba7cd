/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <charconv>
#include <deque>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <qtils/final_action.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/util.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "client/db.hpp"
#include "local/local_cluster.hpp"
#include "log/logger.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }

  using shardkv::app::Configuration;
  using shardkv::client::Context;
  using shardkv::client::DB;
  using shardkv::log::LoggingSystem;

  std::optional<int64_t> parseInt(std::string_view str) {
    int64_t value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
      return std::nullopt;
    }
    return value;
  }

  /// Words which read as integers are stored as integers
  shardkv::api::Value parseValue(std::string_view str) {
    if (auto integer = parseInt(str)) {
      return shardkv::api::Value::makeInt(*integer);
    }
    return shardkv::api::Value::makeString(str);
  }

  void printRows(const shardkv::client::Result &result) {
    for (auto &row : result.rows) {
      fmt::println(std::cout, "{}", row);
    }
    if (result.resume_span) {
      fmt::println(std::cout, "(more rows from {})", *result.resume_span);
    }
  }

  /**
   * Runs the next command taken from the front of `words`.
   * @return false if the command is unknown or lacks arguments
   */
  outcome::result<bool> run_command(const Context &ctx,
                                    DB &db,
                                    shardkv::local::LocalStore &store,
                                    std::deque<std::string> &words) {
    auto name = words.front();
    words.pop_front();

    auto arity = [&](size_t n) {
      if (words.size() < n) {
        fmt::println(std::cerr, "Command '{}' needs {} arguments", name, n);
        return false;
      }
      return true;
    };
    auto take = [&] {
      auto word = std::move(words.front());
      words.pop_front();
      return word;
    };
    auto take_int = [&](int64_t &out) {
      auto word = take();
      auto value = parseInt(word);
      if (not value) {
        fmt::println(std::cerr, "'{}' is not an integer", word);
        return false;
      }
      out = *value;
      return true;
    };

    if (name == "get") {
      if (not arity(1)) {
        return false;
      }
      OUTCOME_TRY(kv, db.get(ctx, take()));
      fmt::println(std::cout, "{}", kv);
    } else if (name == "put") {
      if (not arity(2)) {
        return false;
      }
      auto key = take();
      OUTCOME_TRY(db.put(ctx, key, parseValue(take())));
    } else if (name == "cput") {
      if (not arity(3)) {
        return false;
      }
      auto key = take();
      auto value = parseValue(take());
      auto exp = take();
      if (exp == "-") {
        OUTCOME_TRY(db.cPut(ctx, key, value, std::nullopt));
      } else {
        OUTCOME_TRY(db.cPut(ctx, key, value, parseValue(exp)));
      }
    } else if (name == "inc") {
      if (not arity(2)) {
        return false;
      }
      auto key = take();
      int64_t delta{};
      if (not take_int(delta)) {
        return false;
      }
      OUTCOME_TRY(kv, db.inc(ctx, key, delta));
      fmt::println(std::cout, "{}", kv);
    } else if (name == "scan" or name == "rscan") {
      if (not arity(3)) {
        return false;
      }
      auto from = take();
      auto to = take();
      int64_t max_rows{};
      if (not take_int(max_rows)) {
        return false;
      }
      OUTCOME_TRY(result,
                  name == "scan" ? db.scan(ctx, from, to, max_rows)
                                 : db.reverseScan(ctx, from, to, max_rows));
      printRows(result);
    } else if (name == "del") {
      if (not arity(1)) {
        return false;
      }
      OUTCOME_TRY(db.del(ctx, take()));
    } else if (name == "delrange") {
      if (not arity(2)) {
        return false;
      }
      auto from = take();
      OUTCOME_TRY(keys, db.delRange(ctx, from, take()));
      for (auto &key : keys) {
        fmt::println(std::cout, "deleted {}", shardkv::api::prettyKey(key));
      }
    } else if (name == "split") {
      if (not arity(1)) {
        return false;
      }
      auto key = shardkv::api::keyFromString(take());
      OUTCOME_TRY(db.adminSplit(ctx, key, key));
    } else if (name == "merge") {
      if (not arity(1)) {
        return false;
      }
      OUTCOME_TRY(db.adminMerge(ctx, shardkv::api::keyFromString(take())));
    } else if (name == "ranges") {
      for (auto &desc : store.ranges()) {
        fmt::println(std::cout,
                     "{} lease s{}",
                     desc,
                     store.leaseHolder(desc.start_key));
      }
    } else {
      fmt::println(std::cerr, "Unknown command '{}'", name);
      return false;
    }
    return true;
  }

  int run_commands(std::shared_ptr<LoggingSystem> logsys,
                   std::shared_ptr<Configuration> appcfg) {
    auto logger = logsys->getLogger("Main", shardkv::log::appGroupName);

    auto &cluster_cfg = appcfg->cluster();
    shardkv::local::ClusterConfig config{
        .store =
            {
                .nodes = cluster_cfg.nodes,
                .replication_factor = cluster_cfg.replication_factor,
                .split_keys = {},
            },
        .txn_retry_options = appcfg->client().txn_retry,
        .node_id = appcfg->nodeId(),
        .user_priority = appcfg->client().user_priority,
    };
    for (auto &key : cluster_cfg.split_keys) {
      config.store.split_keys.push_back(shardkv::api::keyFromString(key));
    }

    shardkv::local::LocalCluster cluster(logsys, std::move(config));
    SL_INFO(logger,
            "Local cluster of {} nodes started. Version: {}",
            cluster_cfg.nodes,
            appcfg->version());

    auto ctx = Context::background();
    std::deque<std::string> words(appcfg->commands().begin(),
                                  appcfg->commands().end());
    while (not words.empty()) {
      auto command = words.front();
      auto res = run_command(ctx, cluster.db(), cluster.store(), words);
      if (res.has_error()) {
        SL_ERROR(logger,
                 "Command '{}' failed: {}",
                 command,
                 res.error().message());
        fmt::println(std::cerr, "{}: {}", command, res.error().message());
        return EXIT_FAILURE;
      }
      if (not res.value()) {
        wrong_usage();
        return EXIT_FAILURE;
      }
    }

    logger->flush();
    return EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv, const char **env) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("shardkv");

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc <= 1) {
    wrong_usage();
    return EXIT_FAILURE;
  }

  auto app_configurator =
      std::make_unique<shardkv::app::Configurator>(argc, argv, env);

  // Parse CLI args for help, version and config
  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Parse remaining args
  if (auto res = app_configurator->step2(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto logging_system = ({
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }

    auto log_configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
        std::shared_ptr<soralog::Configurator>(nullptr), log_config.value());

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      (config_result.has_error ? std::cerr : std::cout)
          << config_result.message << '\n';
    }
    if (config_result.has_error) {
      return EXIT_FAILURE;
    }

    std::make_shared<LoggingSystem>(std::move(logging_system));
  });

  if (auto res = logging_system->tuneLoggingSystem(
          app_configurator->getLoggingCliArgs());
      res.has_error()) {
    fmt::println(std::cerr, "Invalid --log option: {}", res.error().message());
    return EXIT_FAILURE;
  }

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator", shardkv::log::appGroupName);

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error.message());
      fmt::println(std::cerr, "Failed to calculate config: {}", error.message());
      fmt::println(std::cerr, "See more details in the log");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  if (app_configuration->commands().empty()) {
    wrong_usage();
    return EXIT_FAILURE;
  }

  return run_commands(logging_system, app_configuration);
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
