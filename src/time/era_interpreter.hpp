/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include <qtils/outcome.hpp>

#include "time/relative_time.hpp"
#include "time/time_error.hpp"
#include "types/slot.hpp"

namespace tipsync::time {

  /**
   * Time-keeping rules of a single era
   */
  struct EraParams {
    EpochSize epoch_size = 0;
    SlotLength slot_length{};

    bool operator==(const EraParams &) const = default;
  };

  /**
   * Point where an era starts or ends, expressed in all three time units
   */
  struct EraBound {
    RelativeTime time;
    Slot slot = 0;
    Epoch epoch = 0;

    bool operator==(const EraBound &) const = default;
  };

  /**
   * Known part of one era. An era without end extends indefinitely.
   */
  struct EraSummary {
    EraBound start;
    std::optional<EraBound> end;
    EraParams params;

    bool operator==(const EraSummary &) const = default;

    bool containsSlot(Slot slot) const {
      return slot >= start.slot and (not end or slot < end->slot);
    }

    bool containsTime(RelativeTime time) const {
      return time >= start.time and (not end or time < end->time);
    }

    bool containsEpoch(Epoch epoch) const {
      return epoch >= start.epoch and (not end or epoch < end->epoch);
    }
  };

  /**
   * Input for building summaries: parameters of an era and the epoch at
   * which the next era takes over (none for an era without known end).
   */
  struct EraDefinition {
    EraParams params;
    std::optional<Epoch> end_epoch;
  };

  /**
   * Lays out consecutive eras starting at the chain origin.
   */
  outcome::result<std::vector<EraSummary>> summarize(
      const std::vector<EraDefinition> &definitions);

  /**
   * Query that can only be answered by the rules of a single era.
   * Returns nullopt when the given era cannot answer it.
   */
  template <typename T>
  using EraQuery = std::function<std::optional<T>(const EraSummary &)>;

  namespace era {

    /// Start of the slot and the length of the slot
    EraQuery<std::pair<RelativeTime, SlotLength>> slotToWallclock(Slot slot);

    /// Slot containing the time and the time already spent in that slot
    EraQuery<std::pair<Slot, Duration>> wallclockToSlot(RelativeTime time);

    /// Epoch of the slot and index of the slot inside the epoch
    EraQuery<std::pair<Epoch, uint64_t>> slotToEpoch(Slot slot);

    EraQuery<Slot> epochToFirstSlot(Epoch epoch);

    /**
     * Answers both queries by the rules of the same era, or not at all.
     */
    template <typename A, typename B>
    EraQuery<std::pair<A, B>> both(EraQuery<A> first, EraQuery<B> second) {
      return [first = std::move(first), second = std::move(second)](
                 const EraSummary &summary) -> std::optional<std::pair<A, B>> {
        auto a = first(summary);
        if (not a) {
          return std::nullopt;
        }
        auto b = second(summary);
        if (not b) {
          return std::nullopt;
        }
        return std::make_pair(std::move(*a), std::move(*b));
      };
    }

  }  // namespace era

  /**
   * Era-aware interpreter of single-era queries over a fixed list of era
   * summaries. Immutable; share it as `std::shared_ptr<const
   * EraInterpreter>`.
   */
  class EraInterpreter {
   public:
    static outcome::result<EraInterpreter> create(
        std::vector<EraSummary> summaries);

    /**
     * Chain which never changed its time-keeping rules
     */
    static outcome::result<EraInterpreter> neverForks(EpochSize epoch_size,
                                                      SlotLength slot_length);

    /**
     * Answers the query by the first era able to answer it as a whole.
     * @return TimeError::PAST_HORIZON if no known era can
     */
    template <typename T>
    outcome::result<T> interpretQuery(const EraQuery<T> &query) const {
      for (const auto &summary : summaries_) {
        if (auto answer = query(summary)) {
          return std::move(*answer);
        }
      }
      return TimeError::PAST_HORIZON;
    }

    const std::vector<EraSummary> &summaries() const {
      return summaries_;
    }

    /**
     * End of the known era history, nullopt if the last era is unbounded
     */
    std::optional<EraBound> horizon() const {
      return summaries_.back().end;
    }

   private:
    explicit EraInterpreter(std::vector<EraSummary> summaries);

    std::vector<EraSummary> summaries_;
  };

}  // namespace tipsync::time
