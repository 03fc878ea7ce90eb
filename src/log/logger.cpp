/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <utility>

OUTCOME_CPP_DEFINE_CATEGORY(tipsync::log, Error, e) {
  using E = tipsync::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown log level";
    case E::WRONG_GROUP:
      return "Unknown log group";
    case E::WRONG_FILTER:
      return "Log filter must be <level> or <group>=<level>";
  }
  return "Unknown log::Error";
}

namespace tipsync::log {

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
    for (const auto &[name, level] : kLevelNames) {
      if (name == str) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  outcome::result<LogFilter> parseLogFilter(std::string_view filter) {
    auto eq = filter.find('=');
    if (eq == std::string_view::npos) {
      BOOST_OUTCOME_TRY(auto level, str2lvl(filter));
      return LogFilter{.group = defaultGroupName, .level = level};
    }
    auto group = filter.substr(0, eq);
    auto level_name = filter.substr(eq + 1);
    if (group.empty() or level_name.empty()) {
      return Error::WRONG_FILTER;
    }
    BOOST_OUTCOME_TRY(auto level, str2lvl(level_name));
    return LogFilter{.group = std::string{group}, .level = level};
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  outcome::result<void> LoggingSystem::tuneLoggingSystem(
      const std::vector<std::string> &filters) {
    for (const auto &filter : filters) {
      BOOST_OUTCOME_TRY(auto parsed, parseLogFilter(filter));
      if (not logging_system_->setLevelOfGroup(parsed.group, parsed.level)) {
        return Error::WRONG_GROUP;
      }
    }
    return outcome::success();
  }

  std::optional<Level> LoggingSystem::levelOfGroup(
      const std::string &group_name) const {
    auto group = logging_system_->getGroup(group_name);
    if (group == nullptr) {
      return std::nullopt;
    }
    return group->level();
  }

}  // namespace tipsync::log
