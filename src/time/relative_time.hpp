/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "types/slot.hpp"

namespace tipsync::time {
  using TimePoint = std::chrono::system_clock::time_point;

  /**
   * Blockchain start (genesis) time
   */
  struct StartTime {
    TimePoint time;

    auto operator<=>(const StartTime &) const = default;
  };

  /**
   * Time elapsed since the blockchain start. Negative values are
   * representable but never produced by conversions from wall-clock time.
   */
  struct RelativeTime {
    Duration since_start{};

    auto operator<=>(const RelativeTime &) const = default;

    Duration operator-(const RelativeTime &other) const {
      return since_start - other.since_start;
    }

    RelativeTime operator+(Duration delta) const {
      return RelativeTime{since_start + delta};
    }

    /// Rounded to the nearest millisecond, ties to even
    std::chrono::milliseconds toMilliseconds() const {
      return std::chrono::round<std::chrono::milliseconds>(since_start);
    }
  };

  /**
   * Converts an absolute time to a time relative to the chain start.
   * @return nullopt if {@param time} precedes {@param start}
   */
  std::optional<RelativeTime> toRelativeTime(StartTime start, TimePoint time);

  /**
   * Same as toRelativeTime, but times before the chain start (only seen on
   * freshly launched test networks) map to RelativeTime{0}.
   */
  RelativeTime toRelativeTimeOrZero(StartTime start, TimePoint time);

  TimePoint fromRelativeTime(StartTime start, RelativeTime relative);

}  // namespace tipsync::time

template <>
struct fmt::formatter<tipsync::time::RelativeTime> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const tipsync::time::RelativeTime &relative,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(
        ctx.out(), "{}ms", relative.toMilliseconds().count());
  }
};

template <>
struct fmt::formatter<tipsync::time::StartTime> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const tipsync::time::StartTime &start, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(
        ctx.out(),
        "{:%Y-%m-%d %H:%M:%S} UTC",
        fmt::gmtime(std::chrono::system_clock::to_time_t(start.time)));
  }
};
