/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <variant>

#include <fmt/format.h>
#include <qtils/outcome.hpp>

#include "clock/clock.hpp"
#include "sync/percentage.hpp"
#include "time/query.hpp"
#include "time/time_interpreter.hpp"
#include "types/slot.hpp"

namespace tipsync::sync {

  /**
   * Lag behind the wall clock within which the node counts as synced
   */
  struct SyncTolerance {
    Duration value;

    bool operator==(const SyncTolerance &) const = default;
  };

  inline constexpr SyncTolerance kDefaultSyncTolerance{
      std::chrono::seconds(300)};

  struct Ready {
    bool operator==(const Ready &) const = default;
  };

  struct Syncing {
    Percentage progress;

    bool operator==(const Syncing &) const = default;
  };

  /// Reported by callers which get no answer from the node at all
  struct NotResponding {
    bool operator==(const NotResponding &) const = default;
  };

  using SyncProgress = std::variant<Ready, Syncing, NotResponding>;

  namespace detail {
    template <typename T>
    outcome::result<T> asResult(outcome::result<T> result) {
      return result;
    }

    template <typename T>
    outcome::result<T> asResult(T value) {
      return value;
    }
  }  // namespace detail

  /**
   * Classifies a node whose chain covers time up to {@param time_covered}.
   *
   * The progress is h / (h + X), with h the part of the chain already
   * ingested and X the estimated rest. Wall-clock time since the start
   * stands in for both since the node cannot trust its own view of the
   * network height: the estimate assumes every remaining slot holds a block
   * and is pessimistic early, and converges to h / h while catching up.
   *
   * @throws std::logic_error if the ratio leaves [0, 1], which means the
   * chain covers more time than has passed
   */
  SyncProgress syncProgressAt(SyncTolerance tolerance,
                              time::RelativeTime time_covered,
                              time::RelativeTime now);

  /**
   * Estimates sync progress of a node whose local tip is at
   * {@param tip_slot}.
   * @return failure if the time interpreter cannot convert the tip slot
   */
  template <typename Handler>
  outcome::result<SyncProgress> syncProgress(
      SyncTolerance tolerance,
      const time::TimeInterpreter<Handler> &ti,
      Slot tip_slot,
      time::RelativeTime now) {
    BOOST_OUTCOME_TRY(
        auto time_covered,
        detail::asResult(ti.interpret(time::slotToRelativeTime(tip_slot))));
    return syncProgressAt(tolerance, time_covered, now);
  }

  /**
   * syncProgress at the current time of {@param clock}. The interpreter is
   * trusted to never fail for the tip; if it does, the failure is logged and
   * thrown as time::PastHorizonException.
   */
  outcome::result<SyncProgress> getSyncProgress(
      SyncTolerance tolerance,
      Slot tip_slot,
      const time::TimeInterpreter<> &ti,
      const clock::SystemClock &clock);

}  // namespace tipsync::sync

template <>
struct fmt::formatter<tipsync::sync::SyncProgress> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const tipsync::sync::SyncProgress &progress,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    using namespace tipsync::sync;
    if (const auto *syncing = std::get_if<Syncing>(&progress)) {
      return fmt::format_to(ctx.out(), "syncing ({})", syncing->progress);
    }
    if (std::holds_alternative<Ready>(progress)) {
      return fmt::format_to(ctx.out(), "ready");
    }
    return fmt::format_to(ctx.out(), "not responding");
  }
};
