/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "time/era_interpreter_holder.hpp"

namespace tipsync::time {

  EraInterpreterHolder::EraInterpreterHolder(
      const log::LoggingSystem &logsys,
      std::shared_ptr<const EraInterpreter> initial)
      : logger_(logsys.getLogger("EraInterpreterHolder", "time")),
        current_(std::move(initial)) {}

  std::shared_ptr<const EraInterpreter> EraInterpreterHolder::get() const {
    std::lock_guard lock(mutex_);
    return current_;
  }

  void EraInterpreterHolder::update(
      std::shared_ptr<const EraInterpreter> interpreter) {
    if (interpreter == nullptr) {
      SL_WARN(logger_, "Ignored attempt to drop the era history");
      return;
    }
    auto horizon = interpreter->horizon();
    auto eras = interpreter->summaries().size();
    {
      std::lock_guard lock(mutex_);
      current_ = std::move(interpreter);
    }
    if (horizon) {
      SL_DEBUG(logger_,
               "Era history updated: {} eras, horizon at slot {}",
               eras,
               horizon->slot);
    } else {
      SL_DEBUG(logger_, "Era history updated: {} eras, no horizon", eras);
    }
  }

}  // namespace tipsync::time
