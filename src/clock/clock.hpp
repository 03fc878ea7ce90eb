/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace tipsync::clock {

  /**
   * Source of wall-clock time. Chain start times and the "now" of sync
   * estimation are both expressed in it.
   */
  class SystemClock {
   public:
    using TimePoint = std::chrono::system_clock::time_point;
    using Duration = std::chrono::system_clock::duration;

    virtual ~SystemClock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;
  };

}  // namespace tipsync::clock
