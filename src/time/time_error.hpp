/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace tipsync::time {

  enum class TimeError : uint8_t {
    /// Requested slot or time lies beyond the known era history
    PAST_HORIZON = 1,
    /// Era summaries are empty, overlapping or have zero parameters
    INVALID_ERA_HISTORY,
    /// Accessor produced no era interpreter
    NO_ERA_INTERPRETER,
  };

}  // namespace tipsync::time

OUTCOME_HPP_DECLARE_ERROR(tipsync::time, TimeError);
