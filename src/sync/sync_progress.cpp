/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sync/sync_progress.hpp"

#include <stdexcept>

namespace tipsync::sync {

  SyncProgress syncProgressAt(SyncTolerance tolerance,
                              time::RelativeTime time_covered,
                              time::RelativeTime now) {
    if (now - time_covered <= tolerance.value) {
      return Ready{};
    }

    // whole milliseconds keep sub-second noise out of early estimates
    auto now_ms = now.toMilliseconds().count();
    Ratio progress{0};
    if (now_ms != 0) {
      progress = Ratio{time_covered.toMilliseconds().count(), now_ms};
    }

    auto percentage = Percentage::create(progress);
    if (percentage.has_error()) {
      throw std::logic_error(fmt::format("syncProgress: {}/{} is out of bounds",
                                         progress.numerator(),
                                         progress.denominator()));
    }
    return Syncing{percentage.value()};
  }

  outcome::result<SyncProgress> getSyncProgress(
      SyncTolerance tolerance,
      Slot tip_slot,
      const time::TimeInterpreter<> &ti,
      const clock::SystemClock &clock) {
    auto now = time::currentRelativeTime(clock, ti);
    return syncProgress(
        tolerance, time::neverFails("syncProgress", ti), tip_slot, now);
  }

}  // namespace tipsync::sync
