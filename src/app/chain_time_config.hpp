/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "sync/sync_progress.hpp"
#include "time/era_interpreter.hpp"
#include "time/relative_time.hpp"

namespace YAML {
  class Node;
}  // namespace YAML

namespace tipsync::log {
  class LoggingSystem;
}  // namespace tipsync::log

namespace tipsync::app {
  enum class ChainTimeConfigError {
    INVALID_DOCUMENT = 1,
    MISSING_GENESIS_TIME,
    MISSING_ERAS,
    INVALID_ERA,
  };
  Q_ENUM_ERROR_CODE(ChainTimeConfigError) {
    using E = decltype(e);
    switch (e) {
      case E::INVALID_DOCUMENT:
        return "Chain time config must be a YAML map";
      case E::MISSING_GENESIS_TIME:
        return "Chain time config has no scalar genesis_time";
      case E::MISSING_ERAS:
        return "Chain time config has no eras";
      case E::INVALID_ERA:
        return "Chain time config has an invalid era";
    }
    return "Unknown ChainTimeConfigError";
  }

  /**
   * Time-keeping parameters of a chain, e.g.
   * @code
   * genesis_time: 1506203091
   * sync_tolerance_ms: 300000
   * eras:
   *   - epoch_size: 21600
   *     slot_length_ms: 20000
   *     end_epoch: 208
   *   - epoch_size: 432000
   *     slot_length_ms: 1000
   * @endcode
   */
  struct ChainTimeConfig {
    time::StartTime start_time;
    sync::SyncTolerance sync_tolerance = sync::kDefaultSyncTolerance;
    std::vector<time::EraDefinition> eras;

    outcome::result<time::EraInterpreter> eraInterpreter() const;
  };

  outcome::result<ChainTimeConfig> readChainTimeConfig(const YAML::Node &yaml);

  outcome::result<ChainTimeConfig> readChainTimeConfig(std::string_view yaml);

  outcome::result<ChainTimeConfig> loadChainTimeConfig(
      const log::LoggingSystem &logsys, const std::filesystem::path &path);

}  // namespace tipsync::app
