/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "time/query.hpp"

namespace tipsync::time {

  Query<StartTime> queryStartTime() {
    return Query<StartTime>{QueryStartTime{}};
  }

  Query<RelativeTime> slotToRelativeTime(Slot slot) {
    return Query<RelativeTime>::eraLocal(
        [wallclock = era::slotToWallclock(slot)](const EraSummary &summary)
            -> std::optional<RelativeTime> {
          if (auto answer = wallclock(summary)) {
            return answer->first;
          }
          return std::nullopt;
        });
  }

  Query<TimePoint> slotToWallclock(Slot slot) {
    return queryStartTime().bind([slot](StartTime start) {
      return slotToRelativeTime(slot).map([start](RelativeTime relative) {
        return fromRelativeTime(start, relative);
      });
    });
  }

  Query<Epoch> slotToEpoch(Slot slot) {
    return Query<std::pair<Epoch, uint64_t>>::eraLocal(era::slotToEpoch(slot))
        .map([](const std::pair<Epoch, uint64_t> &epoch_and_index) {
          return epoch_and_index.first;
        });
  }

  Query<Slot> ongoingSlotAt(RelativeTime time) {
    return Query<std::pair<Slot, Duration>>::eraLocal(
               era::wallclockToSlot(time))
        .map([](const std::pair<Slot, Duration> &slot_and_spent) {
          return slot_and_spent.first;
        });
  }

}  // namespace tipsync::time
