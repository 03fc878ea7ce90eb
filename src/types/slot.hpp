/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace tipsync {
  /// Discrete unit of chain time, counted from genesis.
  using Slot = uint64_t;
  /// Group of consecutive slots.
  using Epoch = uint64_t;
  /// Number of slots in one epoch.
  using EpochSize = uint64_t;

  using Duration = std::chrono::nanoseconds;

  /// Duration of a single slot.
  using SlotLength = Duration;
}  // namespace tipsync
