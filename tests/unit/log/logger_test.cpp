/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <tuple>

#include <qtils/test/outcome.hpp>

#include "testutil/prepare_loggers.hpp"

using tipsync::log::Error;
using tipsync::log::Level;

class LoggerTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void TearDown() override {
    std::ignore = logsys->resetLevelOfGroup("time");
    std::ignore = logsys->setLevelOfGroup(tipsync::log::defaultGroupName,
                                          Level::INFO);
  }

  qtils::SharedRef<tipsync::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
};

TEST_F(LoggerTest, ParsesLevelNames) {
  EXPECT_EQ(tipsync::log::str2lvl("trace").value(), Level::TRACE);
  EXPECT_EQ(tipsync::log::str2lvl("warn").value(), Level::WARN);
  EXPECT_EQ(tipsync::log::str2lvl("warning").value(), Level::WARN);
  EXPECT_EQ(tipsync::log::str2lvl("off").value(), Level::OFF);
  EXPECT_EQ(tipsync::log::str2lvl("loud").error(), Error::WRONG_LEVEL);
}

TEST_F(LoggerTest, TunesDefaultAndNamedGroups) {
  EXPECT_OUTCOME_SUCCESS(logsys->tuneLoggingSystem({"debug", "time=error"}));
  EXPECT_EQ(logsys->levelOfGroup(tipsync::log::defaultGroupName),
            Level::DEBUG);
  EXPECT_EQ(logsys->levelOfGroup("time"), Level::ERROR);
  EXPECT_EQ(logsys->levelOfGroup("nowhere"), std::nullopt);
}

TEST_F(LoggerTest, RejectsMalformedFilters) {
  EXPECT_EQ(logsys->tuneLoggingSystem({"=debug"}).error(), Error::WRONG_FILTER);
  EXPECT_EQ(logsys->tuneLoggingSystem({"time="}).error(), Error::WRONG_FILTER);
  EXPECT_EQ(logsys->tuneLoggingSystem({"time=loud"}).error(),
            Error::WRONG_LEVEL);
  EXPECT_EQ(logsys->tuneLoggingSystem({"nowhere=debug"}).error(),
            Error::WRONG_GROUP);
}

TEST_F(LoggerTest, ParsesFilters) {
  ASSERT_OUTCOME_SUCCESS(level_only, tipsync::log::parseLogFilter("warn"));
  EXPECT_EQ(level_only.group, tipsync::log::defaultGroupName);
  EXPECT_EQ(level_only.level, Level::WARN);

  ASSERT_OUTCOME_SUCCESS(grouped,
                         tipsync::log::parseLogFilter("config=trace"));
  EXPECT_EQ(grouped.group, "config");
  EXPECT_EQ(grouped.level, Level::TRACE);
}

/**
 * @given a live logging system
 * @when one more is constructed
 * @then construction fails and the first one keeps working
 */
TEST_F(LoggerTest, OnlyOneLoggingSystem) {
  EXPECT_THROW(tipsync::log::LoggingSystem{nullptr}, std::logic_error);
  EXPECT_TRUE(logsys->levelOfGroup("time").has_value());
}
