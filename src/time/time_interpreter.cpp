/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "time/time_interpreter.hpp"

#include "time/era_interpreter_holder.hpp"

namespace tipsync::time {

  TimeInterpreterLogSink makeLogSink(log::Logger logger) {
    return [logger = std::move(logger)](const TimeInterpreterLog &log) {
      if (log.reason) {
        SL_ERROR(logger, "{}", log);
      } else {
        SL_DEBUG(logger, "{}", log);
      }
    };
  }

  TimeInterpreter<RaiseOnFailure> neverFails(
      std::string reason, const TimeInterpreter<PropagateFailure> &ti) {
    auto with_reason = [reason, sink = ti.logSink()](TimeInterpreterLog log) {
      log.reason = reason;
      sink(log);
    };
    return TimeInterpreter<RaiseOnFailure>{
        ti.interpreter(),
        ti.blockchainStartTime(),
        std::move(with_reason),
        RaiseOnFailure{.reason = std::move(reason)},
    };
  }

  outcome::result<TimeInterpreter<>> mkTimeInterpreter(
      TimeInterpreterLogSink log_sink,
      StartTime start_time,
      EpochSize epoch_size,
      SlotLength slot_length) {
    BOOST_OUTCOME_TRY(auto interpreter,
                      EraInterpreter::neverForks(epoch_size, slot_length));
    auto snapshot =
        std::make_shared<const EraInterpreter>(std::move(interpreter));
    return TimeInterpreter<>{
        [snapshot]() -> outcome::result<EraInterpreterSnapshot> {
          return snapshot;
        },
        start_time,
        std::move(log_sink),
    };
  }

  TimeInterpreter<> mkTimeInterpreter(
      TimeInterpreterLogSink log_sink,
      StartTime start_time,
      std::shared_ptr<const EraInterpreterHolder> holder) {
    return TimeInterpreter<>{
        [holder = std::move(holder)]()
            -> outcome::result<EraInterpreterSnapshot> {
          return holder->get();
        },
        start_time,
        std::move(log_sink),
    };
  }

}  // namespace tipsync::time
