/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/chain_time_config.hpp"

#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

#include "log/logger.hpp"

namespace tipsync::app {

  namespace {
    constexpr uint64_t kMaxSlotLengthMs =
        std::chrono::duration_cast<std::chrono::milliseconds>(Duration::max())
            .count();

    template <typename T>
    std::optional<T> scalar(const YAML::Node &node) {
      if (not node.IsDefined() or not node.IsScalar()) {
        return std::nullopt;
      }
      T value{};
      if (not YAML::convert<T>::decode(node, value)) {
        return std::nullopt;
      }
      return value;
    }

    outcome::result<time::EraDefinition> readEra(const YAML::Node &yaml) {
      if (not yaml.IsMap()) {
        return ChainTimeConfigError::INVALID_ERA;
      }
      auto epoch_size = scalar<uint64_t>(yaml["epoch_size"]);
      auto slot_length_ms = scalar<uint64_t>(yaml["slot_length_ms"]);
      if (not epoch_size or not slot_length_ms) {
        return ChainTimeConfigError::INVALID_ERA;
      }
      if (*slot_length_ms > kMaxSlotLengthMs) {
        return ChainTimeConfigError::INVALID_ERA;
      }
      time::EraDefinition era{
          .params =
              time::EraParams{
                  .epoch_size = *epoch_size,
                  .slot_length = std::chrono::milliseconds(*slot_length_ms),
              },
          .end_epoch = std::nullopt,
      };
      if (yaml["end_epoch"].IsDefined()) {
        auto end_epoch = scalar<uint64_t>(yaml["end_epoch"]);
        if (not end_epoch) {
          return ChainTimeConfigError::INVALID_ERA;
        }
        era.end_epoch = *end_epoch;
      }
      return era;
    }
  }  // namespace

  outcome::result<time::EraInterpreter> ChainTimeConfig::eraInterpreter()
      const {
    BOOST_OUTCOME_TRY(auto summaries, time::summarize(eras));
    return time::EraInterpreter::create(std::move(summaries));
  }

  outcome::result<ChainTimeConfig> readChainTimeConfig(const YAML::Node &yaml) {
    if (not yaml.IsMap()) {
      return ChainTimeConfigError::INVALID_DOCUMENT;
    }

    auto genesis_time = scalar<int64_t>(yaml["genesis_time"]);
    if (not genesis_time) {
      return ChainTimeConfigError::MISSING_GENESIS_TIME;
    }

    ChainTimeConfig config{
        .start_time =
            time::StartTime{
                time::TimePoint{std::chrono::seconds(*genesis_time)},
            },
    };

    if (yaml["sync_tolerance_ms"].IsDefined()) {
      auto tolerance_ms = scalar<uint64_t>(yaml["sync_tolerance_ms"]);
      if (not tolerance_ms) {
        return ChainTimeConfigError::INVALID_DOCUMENT;
      }
      config.sync_tolerance =
          sync::SyncTolerance{std::chrono::milliseconds(*tolerance_ms)};
    }

    auto yaml_eras = yaml["eras"];
    if (not yaml_eras.IsSequence() or yaml_eras.size() == 0) {
      return ChainTimeConfigError::MISSING_ERAS;
    }
    for (auto &&yaml_era : yaml_eras) {
      BOOST_OUTCOME_TRY(auto era, readEra(yaml_era));
      config.eras.emplace_back(era);
    }
    // eras must lay out within representable time
    if (time::summarize(config.eras).has_error()) {
      return ChainTimeConfigError::INVALID_ERA;
    }
    return config;
  }

  outcome::result<ChainTimeConfig> readChainTimeConfig(std::string_view yaml) {
    YAML::Node node;
    try {
      node = YAML::Load(std::string{yaml});
    } catch (const YAML::Exception &) {
      return ChainTimeConfigError::INVALID_DOCUMENT;
    }
    return readChainTimeConfig(node);
  }

  outcome::result<ChainTimeConfig> loadChainTimeConfig(
      const log::LoggingSystem &logsys, const std::filesystem::path &path) {
    auto logger = logsys.getLogger("ChainTimeConfig", "config");

    YAML::Node node;
    try {
      node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception &exception) {
      SL_ERROR(logger,
               "Can't parse chain time config {}: {}",
               path.string(),
               exception.what());
      return ChainTimeConfigError::INVALID_DOCUMENT;
    }

    auto config = readChainTimeConfig(node);
    if (config.has_error()) {
      SL_ERROR(logger,
               "Invalid chain time config {}: {}",
               path.string(),
               config.error());
      return config.error();
    }
    SL_INFO(logger,
            "Chain time config loaded: genesis {}, {} eras, sync tolerance "
            "{}ms",
            config.value().start_time,
            config.value().eras.size(),
            std::chrono::duration_cast<std::chrono::milliseconds>(
                config.value().sync_tolerance.value)
                .count());
    return config;
  }

}  // namespace tipsync::app
