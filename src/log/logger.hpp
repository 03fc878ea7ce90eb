/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
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

namespace tipsync::log {
  using soralog::Level;

  using Logger = qtils::SharedRef<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1, WRONG_GROUP, WRONG_FILTER };

  outcome::result<Level> str2lvl(std::string_view str);

  inline static std::string defaultGroupName{"tipsync"};

  /**
   * Level override of one logging group
   */
  struct LogFilter {
    std::string group;
    Level level;
  };

  /**
   * Parses `<level>` (default group) or `<group>=<level>`
   */
  outcome::result<LogFilter> parseLogFilter(std::string_view filter);

  /**
   * Owns the soralog logging system of the process and hands out loggers.
   * Only one instance may exist at a time.
   */
  class LoggingSystem : public Singleton<LoggingSystem> {
   public:
    explicit LoggingSystem(
        std::shared_ptr<soralog::LoggingSystem> logging_system);

    /**
     * Applies filters in order. Stops at the first one which is malformed
     * or names an unknown group; earlier filters stay applied.
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

    [[nodiscard]] bool resetLevelOfGroup(const std::string &group_name) const {
      return logging_system_->resetLevelOfGroup(group_name);
    }

    /// nullopt for an unknown group
    std::optional<Level> levelOfGroup(const std::string &group_name) const;

   private:
    std::shared_ptr<soralog::LoggingSystem> logging_system_;
  };

}  // namespace tipsync::log

OUTCOME_HPP_DECLARE_ERROR(tipsync::log, Error);
