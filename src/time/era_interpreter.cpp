/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "time/era_interpreter.hpp"

#include <limits>

namespace tipsync::time {

  namespace {
    bool validParams(const EraParams &params) {
      return params.epoch_size != 0 and params.slot_length > Duration::zero();
    }

    /// {@param count} slots after {@param start}, nullopt if not representable
    std::optional<RelativeTime> slotsAfter(RelativeTime start,
                                           SlotLength slot_length,
                                           uint64_t count) {
      auto length = static_cast<uint64_t>(slot_length.count());
      auto max = static_cast<uint64_t>(Duration::max().count());
      if (count > max / length) {
        return std::nullopt;
      }
      Duration span{static_cast<Duration::rep>(count * length)};
      if (start.since_start > Duration::max() - span) {
        return std::nullopt;
      }
      return start + span;
    }

    /// {@param base} + {@param count} * {@param factor}, nullopt on overflow
    std::optional<uint64_t> mulAdd(uint64_t base,
                                   uint64_t count,
                                   uint64_t factor) {
      constexpr auto kMax = std::numeric_limits<uint64_t>::max();
      if (factor != 0 and count > kMax / factor) {
        return std::nullopt;
      }
      auto product = count * factor;
      if (base > kMax - product) {
        return std::nullopt;
      }
      return base + product;
    }

    std::optional<EraBound> boundAfter(const EraBound &start,
                                       const EraParams &params,
                                       Epoch end_epoch) {
      auto end_slot =
          mulAdd(start.slot, end_epoch - start.epoch, params.epoch_size);
      if (not end_slot) {
        return std::nullopt;
      }
      auto end_time =
          slotsAfter(start.time, params.slot_length, *end_slot - start.slot);
      if (not end_time) {
        return std::nullopt;
      }
      return EraBound{
          .time = *end_time,
          .slot = *end_slot,
          .epoch = end_epoch,
      };
    }
  }  // namespace

  outcome::result<std::vector<EraSummary>> summarize(
      const std::vector<EraDefinition> &definitions) {
    std::vector<EraSummary> summaries;
    summaries.reserve(definitions.size());

    EraBound start{};
    for (const auto &definition : definitions) {
      if (not validParams(definition.params)) {
        return TimeError::INVALID_ERA_HISTORY;
      }
      if (not summaries.empty() and not summaries.back().end) {
        // only the last era may be open-ended
        return TimeError::INVALID_ERA_HISTORY;
      }
      std::optional<EraBound> end;
      if (definition.end_epoch) {
        if (*definition.end_epoch <= start.epoch) {
          return TimeError::INVALID_ERA_HISTORY;
        }
        end = boundAfter(start, definition.params, *definition.end_epoch);
        if (not end) {
          // era ends beyond representable time
          return TimeError::INVALID_ERA_HISTORY;
        }
      }
      summaries.emplace_back(EraSummary{
          .start = start,
          .end = end,
          .params = definition.params,
      });
      if (end) {
        start = *end;
      }
    }
    return summaries;
  }

  EraInterpreter::EraInterpreter(std::vector<EraSummary> summaries)
      : summaries_(std::move(summaries)) {}

  outcome::result<EraInterpreter> EraInterpreter::create(
      std::vector<EraSummary> summaries) {
    if (summaries.empty()) {
      return TimeError::INVALID_ERA_HISTORY;
    }
    for (size_t i = 0; i < summaries.size(); ++i) {
      const auto &summary = summaries[i];
      if (not validParams(summary.params)) {
        return TimeError::INVALID_ERA_HISTORY;
      }
      if (summary.end) {
        const auto &end = *summary.end;
        if (end.slot <= summary.start.slot or end.epoch <= summary.start.epoch
            or end.time <= summary.start.time) {
          return TimeError::INVALID_ERA_HISTORY;
        }
      }
      if (i + 1 < summaries.size()) {
        if (summary.end != summaries[i + 1].start) {
          return TimeError::INVALID_ERA_HISTORY;
        }
      }
    }
    return EraInterpreter{std::move(summaries)};
  }

  outcome::result<EraInterpreter> EraInterpreter::neverForks(
      EpochSize epoch_size, SlotLength slot_length) {
    return create({EraSummary{
        .start = EraBound{},
        .end = std::nullopt,
        .params =
            EraParams{
                .epoch_size = epoch_size,
                .slot_length = slot_length,
            },
    }});
  }

  namespace era {

    EraQuery<std::pair<RelativeTime, SlotLength>> slotToWallclock(Slot slot) {
      return [slot](const EraSummary &summary)
                 -> std::optional<std::pair<RelativeTime, SlotLength>> {
        if (not summary.containsSlot(slot)) {
          return std::nullopt;
        }
        auto start = slotsAfter(summary.start.time,
                                summary.params.slot_length,
                                slot - summary.start.slot);
        if (not start) {
          return std::nullopt;
        }
        return std::make_pair(*start, summary.params.slot_length);
      };
    }

    EraQuery<std::pair<Slot, Duration>> wallclockToSlot(RelativeTime time) {
      return [time](const EraSummary &summary)
                 -> std::optional<std::pair<Slot, Duration>> {
        if (not summary.containsTime(time)) {
          return std::nullopt;
        }
        auto since_era_start = time - summary.start.time;
        auto slots_in_era = since_era_start / summary.params.slot_length;
        return std::make_pair(
            summary.start.slot + static_cast<Slot>(slots_in_era),
            since_era_start % summary.params.slot_length);
      };
    }

    EraQuery<std::pair<Epoch, uint64_t>> slotToEpoch(Slot slot) {
      return [slot](const EraSummary &summary)
                 -> std::optional<std::pair<Epoch, uint64_t>> {
        if (not summary.containsSlot(slot)) {
          return std::nullopt;
        }
        auto slots_in_era = slot - summary.start.slot;
        return std::make_pair(
            summary.start.epoch + slots_in_era / summary.params.epoch_size,
            slots_in_era % summary.params.epoch_size);
      };
    }

    EraQuery<Slot> epochToFirstSlot(Epoch epoch) {
      return [epoch](const EraSummary &summary) -> std::optional<Slot> {
        if (not summary.containsEpoch(epoch)) {
          return std::nullopt;
        }
        return mulAdd(summary.start.slot,
                      epoch - summary.start.epoch,
                      summary.params.epoch_size);
      };
    }

  }  // namespace era

}  // namespace tipsync::time
