/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "utils/ctor_limiters.hpp"

namespace shardkv::log {
  using soralog::Level;

  using Logger = qtils::SharedRef<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1, WRONG_GROUP, WRONG_FILTER };

  /// Parses level names as accepted by the `--log` option
  outcome::result<Level> str2lvl(std::string_view str);

  inline static std::string defaultGroupName{"shardkv"};

  /// Group of the client-side batching and transaction layer
  inline static std::string clientGroupName{"kv_client"};

  /// Group of the in-process range store
  inline static std::string storeGroupName{"local_store"};

  /// Group of the command line application
  inline static std::string appGroupName{"app"};

  class LoggingSystem : public Singleton<LoggingSystem> {
   public:
    explicit LoggingSystem(
        std::shared_ptr<soralog::LoggingSystem> logging_system);

    /**
     * Applies filters of form `<level>` (all groups of the project) or
     * `<group>=<level>`. Filters before a malformed one stay applied.
     */
    outcome::result<void> tuneLoggingSystem(
        const std::vector<std::string> &filters);

    [[nodiscard]] Logger getLogger(const std::string &logger_name,
                                   const std::string &group_name) const {
      return logging_system_->getLogger(logger_name, group_name);
    }

    [[nodiscard]] bool setLevelOfGroup(const std::string &group_name,
                                       Level level) const {
      return logging_system_->setLevelOfGroup(group_name, level);
    }

   private:
    outcome::result<void> applyFilter(std::string_view filter);

    std::shared_ptr<soralog::LoggingSystem> logging_system_;
  };

}  // namespace shardkv::log

OUTCOME_HPP_DECLARE_ERROR(shardkv::log, Error);
