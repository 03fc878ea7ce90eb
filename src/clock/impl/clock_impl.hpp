/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace tipsync::clock {

  /// SystemClock backed by std::chrono::system_clock
  class SystemClockImpl final : public SystemClock {
   public:
    TimePoint now() const override;
  };

}  // namespace tipsync::clock
