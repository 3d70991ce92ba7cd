/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <utility>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(shardkv::log, Error, e) {
  using E = shardkv::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
    case E::WRONG_FILTER:
      return "Malformed log filter, expected <level> or <group>=<level>";
  }
  return "Unknown log::Error";
}

namespace shardkv::log {

  namespace {
    constexpr std::array<std::pair<std::string_view, Level>, 14> kLevelNames{{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO},
        {"inf", Level::INFO},
        {"warning", Level::WARN},
        {"warn", Level::WARN},
        {"error", Level::ERROR},
        {"err", Level::ERROR},
        {"critical", Level::CRITICAL},
        {"crit", Level::CRITICAL},
        {"off", Level::OFF},
        {"no", Level::OFF},
        {"none", Level::OFF},
    }};
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    for (auto &[name, level] : kLevelNames) {
      if (name == str) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  outcome::result<void> LoggingSystem::tuneLoggingSystem(
      const std::vector<std::string> &filters) {
    for (auto &filter : filters) {
      OUTCOME_TRY(applyFilter(filter));
    }
    return outcome::success();
  }

  outcome::result<void> LoggingSystem::applyFilter(std::string_view filter) {
    auto eq = filter.find('=');
    if (eq == std::string_view::npos) {
      OUTCOME_TRY(level, str2lvl(filter));
      logging_system_->setLevelOfGroup(defaultGroupName, level);
      return outcome::success();
    }

    auto group_name = std::string(filter.substr(0, eq));
    if (group_name.empty() or eq + 1 == filter.size()) {
      return Error::WRONG_FILTER;
    }
    if (not logging_system_->getGroup(group_name)) {
      return Error::WRONG_GROUP;
    }
    OUTCOME_TRY(level, str2lvl(filter.substr(eq + 1)));
    logging_system_->setLevelOfGroup(group_name, level);
    return outcome::success();
  }

}  // namespace shardkv::log
