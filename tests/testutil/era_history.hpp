/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <stdexcept>

#include "time/era_interpreter.hpp"

namespace testutil {
  using namespace std::chrono_literals;

  /**
   * Two eras with a known end:
   *  - slots [0, 100): 20s slots, 10 slots per epoch, time [0s, 2000s)
   *  - slots [100, 300): 1s slots, 100 slots per epoch, time [2000s, 2200s)
   * Anything from slot 300 on is past the horizon.
   */
  inline std::vector<tipsync::time::EraDefinition> twoEraDefinitions() {
    return {
        {
            .params = {.epoch_size = 10, .slot_length = 20s},
            .end_epoch = 10,
        },
        {
            .params = {.epoch_size = 100, .slot_length = 1s},
            .end_epoch = 12,
        },
    };
  }

  inline std::shared_ptr<const tipsync::time::EraInterpreter>
  twoEraInterpreter() {
    auto summaries = tipsync::time::summarize(twoEraDefinitions());
    if (summaries.has_error()) {
      throw std::runtime_error("Can't summarize test eras");
    }
    auto interpreter =
        tipsync::time::EraInterpreter::create(std::move(summaries.value()));
    if (interpreter.has_error()) {
      throw std::runtime_error("Can't create test era interpreter");
    }
    return std::make_shared<const tipsync::time::EraInterpreter>(
        std::move(interpreter.value()));
  }

  /// Same as twoEraInterpreter, but the second era never ends
  inline std::shared_ptr<const tipsync::time::EraInterpreter>
  extendedEraInterpreter() {
    auto definitions = twoEraDefinitions();
    definitions.back().end_epoch.reset();
    auto summaries = tipsync::time::summarize(definitions);
    if (summaries.has_error()) {
      throw std::runtime_error("Can't summarize test eras");
    }
    auto interpreter =
        tipsync::time::EraInterpreter::create(std::move(summaries.value()));
    if (interpreter.has_error()) {
      throw std::runtime_error("Can't create test era interpreter");
    }
    return std::make_shared<const tipsync::time::EraInterpreter>(
        std::move(interpreter.value()));
  }
}  // namespace testutil
