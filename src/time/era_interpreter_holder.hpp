/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>

#include "log/logger.hpp"
#include "time/era_interpreter.hpp"

namespace tipsync::time {

  /**
   * Keeps the latest known era history. Readers take a snapshot which stays
   * valid after the history is replaced.
   */
  class EraInterpreterHolder {
   public:
    EraInterpreterHolder(const log::LoggingSystem &logsys,
                         std::shared_ptr<const EraInterpreter> initial);

    std::shared_ptr<const EraInterpreter> get() const;

    void update(std::shared_ptr<const EraInterpreter> interpreter);

   private:
    log::Logger logger_;
    mutable std::mutex mutex_;
    std::shared_ptr<const EraInterpreter> current_;
  };

}  // namespace tipsync::time
