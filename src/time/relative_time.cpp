/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "time/relative_time.hpp"

namespace tipsync::time {

  std::optional<RelativeTime> toRelativeTime(StartTime start, TimePoint time) {
    if (time < start.time) {
      return std::nullopt;
    }
    return RelativeTime{
        std::chrono::duration_cast<Duration>(time - start.time),
    };
  }

  RelativeTime toRelativeTimeOrZero(StartTime start, TimePoint time) {
    return toRelativeTime(start, time).value_or(RelativeTime{});
  }

  TimePoint fromRelativeTime(StartTime start, RelativeTime relative) {
    return start.time
         + std::chrono::duration_cast<TimePoint::duration>(
               relative.since_start);
  }

}  // namespace tipsync::time
