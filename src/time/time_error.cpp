/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "time/time_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tipsync::time, TimeError, e) {
  using E = tipsync::time::TimeError;
  switch (e) {
    case E::PAST_HORIZON:
      return "Query is past the horizon of the known era history";
    case E::INVALID_ERA_HISTORY:
      return "Era history is invalid";
    case E::NO_ERA_INTERPRETER:
      return "Era interpreter is not available";
  }
  return "Unknown time::TimeError";
}
