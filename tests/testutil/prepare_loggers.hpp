/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <iostream>
#include <stdexcept>

#include <soralog/impl/configurator_from_yaml.hpp>
#include <yaml-cpp/yaml.h>

#include "log/logger.hpp"

namespace testutil {

  namespace detail {
    constexpr std::string_view kTestingLogConfig = R"(
sinks:
  - name: console
    type: console
    capacity: 4
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: testing
        level: trace
      - name: shardkv
        children:
          - name: kv_client
          - name: local_store
          - name: app
)";

    inline qtils::SharedRef<shardkv::log::LoggingSystem> makeLoggingSystem() {
      auto configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
          YAML::Load(std::string(kTestingLogConfig)));
      auto soralog_system =
          std::make_shared<soralog::LoggingSystem>(std::move(configurator));

      auto result = soralog_system->configure();
      if (not result.message.empty()) {
        (result.has_error ? std::cerr : std::cout) << result.message << '\n';
      }
      if (result.has_error) {
        throw std::runtime_error("Cannot configure logging for tests");
      }
      return std::make_shared<shardkv::log::LoggingSystem>(
          std::move(soralog_system));
    }
  }  // namespace detail

  /**
   * Logging system shared by all tests of the binary; `level` is applied to
   * the project group on every call. Supposed to be called in
   * SetUpTestCase.
   */
  inline qtils::SharedRef<shardkv::log::LoggingSystem> prepareLoggers(
      soralog::Level level = soralog::Level::INFO) {
    static auto logging_system = detail::makeLoggingSystem();
    std::ignore =
        logging_system->setLevelOfGroup(shardkv::log::defaultGroupName, level);
    return logging_system;
  }

}  // namespace testutil
