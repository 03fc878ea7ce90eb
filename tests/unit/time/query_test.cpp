/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "time/query.hpp"

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "testutil/era_history.hpp"

using namespace std::chrono_literals;
using tipsync::Slot;
using tipsync::time::Query;
using tipsync::time::queryStartTime;
using tipsync::time::QueryRunner;
using tipsync::time::RelativeTime;
using tipsync::time::StartTime;
using tipsync::time::TimeError;
using tipsync::time::TimePoint;
namespace era = tipsync::time::era;

class QueryTest : public ::testing::Test {
 protected:
  StartTime start_time{TimePoint{std::chrono::seconds(1'500'000'000)}};
  std::shared_ptr<const tipsync::time::EraInterpreter> eras =
      testutil::twoEraInterpreter();
  QueryRunner runner{start_time, *eras};
};

TEST_F(QueryTest, PureYieldsItsValue) {
  ASSERT_OUTCOME_SUCCESS(value, runner.run(Query<int>::pure(42)));
  EXPECT_EQ(value, 42);
}

TEST_F(QueryTest, StartTimeYieldsTheRunnerStartTime) {
  ASSERT_OUTCOME_SUCCESS(value, runner.run(queryStartTime()));
  EXPECT_EQ(value, start_time);
}

TEST_F(QueryTest, EraLocalQueryIsDelegated) {
  ASSERT_OUTCOME_SUCCESS(time,
                         runner.run(tipsync::time::slotToRelativeTime(150)));
  EXPECT_EQ(time, RelativeTime{2050s});

  auto past = runner.run(tipsync::time::slotToRelativeTime(300));
  ASSERT_TRUE(past.has_error());
  EXPECT_EQ(past.error(), TimeError::PAST_HORIZON);
}

/**
 * @given a value and a continuation building a query from it
 * @when pure(value).bind(continuation) is run
 * @then the result is the same as running continuation(value)
 */
TEST_F(QueryTest, BindHasLeftIdentity) {
  auto continuation = [](Slot slot) {
    return tipsync::time::slotToRelativeTime(slot);
  };
  for (Slot slot : {Slot{0}, Slot{99}, Slot{150}, Slot{300}}) {
    auto bound = runner.run(Query<Slot>::pure(slot).bind(continuation));
    auto direct = runner.run(continuation(slot));
    ASSERT_EQ(bound.has_value(), direct.has_value());
    if (direct.has_value()) {
      EXPECT_EQ(bound.value(), direct.value());
    } else {
      EXPECT_EQ(bound.error(), direct.error());
    }
  }
}

/**
 * @given a query
 * @when it is bound to pure
 * @then the result is the same as running the query itself
 */
TEST_F(QueryTest, BindHasRightIdentity) {
  for (Slot slot : {Slot{0}, Slot{99}, Slot{150}, Slot{300}}) {
    auto query = tipsync::time::slotToRelativeTime(slot);
    auto bound = runner.run(query.bind(
        [](RelativeTime time) { return Query<RelativeTime>::pure(time); }));
    auto direct = runner.run(query);
    ASSERT_EQ(bound.has_value(), direct.has_value());
    if (direct.has_value()) {
      EXPECT_EQ(bound.value(), direct.value());
    } else {
      EXPECT_EQ(bound.error(), direct.error());
    }
  }
}

/**
 * @given two slots of different eras
 * @when their times are combined by bind
 * @then the query succeeds, while the same pair asked as one era-local query
 * is past the horizon of every single era
 */
TEST_F(QueryTest, BindComposesQueriesOfDifferentEras) {
  auto composite = tipsync::time::slotToRelativeTime(50).bind(
      [](RelativeTime byron) {
        return tipsync::time::slotToRelativeTime(150).map(
            [byron](RelativeTime shelley) { return shelley - byron; });
      });
  ASSERT_OUTCOME_SUCCESS(distance, runner.run(composite));
  EXPECT_EQ(distance, 1050s);

  auto single_era =
      Query<std::pair<std::pair<RelativeTime, tipsync::SlotLength>,
                      std::pair<RelativeTime, tipsync::SlotLength>>>::
          eraLocal(era::both(era::slotToWallclock(50),
                             era::slotToWallclock(150)));
  auto result = runner.run(single_era);
  ASSERT_TRUE(result.has_error());
  EXPECT_EQ(result.error(), TimeError::PAST_HORIZON);
}

/**
 * @given a chain of binds with a failing leaf deep inside
 * @when it is run
 * @then the whole query fails with the leaf's error and no later step runs
 */
TEST_F(QueryTest, LeafFailureAbortsWholeQuery) {
  int steps_after_failure = 0;

  Query<Slot> query = Query<Slot>::pure(0);
  for (int depth = 0; depth < 10; ++depth) {
    query = query.bind([](Slot slot) { return Query<Slot>::pure(slot + 1); });
  }
  auto failing =
      query
          .bind([](Slot slot) {
            return tipsync::time::slotToRelativeTime(slot + 1000);
          })
          .bind([&steps_after_failure](RelativeTime time) {
            ++steps_after_failure;
            return Query<RelativeTime>::pure(time);
          });

  auto result = runner.run(failing);
  ASSERT_TRUE(result.has_error());
  EXPECT_EQ(result.error(), TimeError::PAST_HORIZON);
  EXPECT_EQ(steps_after_failure, 0);
}

TEST_F(QueryTest, QueriesCanBeRunRepeatedly) {
  auto query = tipsync::time::slotToRelativeTime(10);
  ASSERT_OUTCOME_SUCCESS(first, runner.run(query));
  ASSERT_OUTCOME_SUCCESS(second, runner.run(query));
  EXPECT_EQ(first, second);
}

TEST_F(QueryTest, SlotToWallclockUsesStartTime) {
  ASSERT_OUTCOME_SUCCESS(time, runner.run(tipsync::time::slotToWallclock(150)));
  EXPECT_EQ(time, start_time.time + 2050s);
}

TEST_F(QueryTest, DerivedConversions) {
  ASSERT_OUTCOME_SUCCESS(epoch, runner.run(tipsync::time::slotToEpoch(250)));
  EXPECT_EQ(epoch, 11);

  ASSERT_OUTCOME_SUCCESS(
      slot, runner.run(tipsync::time::ongoingSlotAt(RelativeTime{2099500ms})));
  EXPECT_EQ(slot, 199);
}
