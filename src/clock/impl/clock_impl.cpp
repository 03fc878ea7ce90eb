/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/clock_impl.hpp"

namespace tipsync::clock {

  SystemClock::TimePoint SystemClockImpl::now() const {
    return std::chrono::system_clock::now();
  }

}  // namespace tipsync::clock
