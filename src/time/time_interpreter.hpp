/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <qtils/outcome.hpp>

#include "clock/clock.hpp"
#include "log/logger.hpp"
#include "time/era_interpreter.hpp"
#include "time/query.hpp"
#include "time/relative_time.hpp"

namespace tipsync::time {
  class EraInterpreterHolder;

  /**
   * Diagnostic emitted when a query could not be answered
   */
  struct TimeInterpreterLog {
    /// Why the failure was expected to be impossible, if it was
    std::optional<std::string> reason;
    StartTime start_time;
    std::error_code error;
  };

  using EraInterpreterSnapshot = std::shared_ptr<const EraInterpreter>;

  using EraInterpreterAccessor =
      std::function<outcome::result<EraInterpreterSnapshot>()>;

  using TimeInterpreterLogSink = std::function<void(const TimeInterpreterLog &)>;

  /**
   * Sink writing to the logger: error severity when the failure was
   * declared impossible, debug otherwise.
   */
  TimeInterpreterLogSink makeLogSink(log::Logger logger);

  /**
   * Thrown by interpreters made with neverFails() when a query fails anyway
   */
  class PastHorizonException : public std::system_error {
   public:
    PastHorizonException(std::error_code error, std::string reason)
        : std::system_error(error, reason), reason_(std::move(reason)) {}

    const std::string &reason() const {
      return reason_;
    }

   private:
    std::string reason_;
  };

  /**
   * Hands failures to the caller as values
   */
  struct PropagateFailure {
    template <typename T>
    outcome::result<T> operator()(outcome::result<T> result) const {
      return result;
    }
  };

  /**
   * Turns failures into PastHorizonException
   */
  struct RaiseOnFailure {
    std::string reason;

    template <typename T>
    T operator()(outcome::result<T> result) const {
      if (result.has_error()) {
        throw PastHorizonException(result.error(), reason);
      }
      return std::move(result).value();
    }
  };

  /**
   * Result handler followed by a transformation of its output
   */
  template <typename Handler, typename Transform>
  struct HoistedHandler {
    Handler handler;
    Transform transform;

    template <typename T>
    auto operator()(outcome::result<T> result) const {
      return std::invoke(transform, std::invoke(handler, std::move(result)));
    }
  };

  /**
   * Runs queries against the current era history with the chain start time
   * as context.
   *
   * @tparam Handler decides what a query result becomes for the caller.
   * With PropagateFailure `interpret` returns `outcome::result<T>`, with
   * RaiseOnFailure a bare `T`.
   */
  template <typename Handler = PropagateFailure>
  class TimeInterpreter {
   public:
    TimeInterpreter(EraInterpreterAccessor interpreter,
                    StartTime start_time,
                    TimeInterpreterLogSink log_sink,
                    Handler handle_result = {})
        : interpreter_(std::move(interpreter)),
          start_time_(start_time),
          log_sink_(std::move(log_sink)),
          handle_result_(std::move(handle_result)) {}

    /**
     * Fetches the era interpreter once and evaluates the whole query with
     * that snapshot. Failures are reported to the log sink before the
     * handler sees them.
     */
    template <typename T>
    auto interpret(const Query<T> &query) const {
      auto result = [&]() -> outcome::result<T> {
        BOOST_OUTCOME_TRY(auto snapshot, interpreter_());
        if (snapshot == nullptr) {
          return TimeError::NO_ERA_INTERPRETER;
        }
        return runQuery(start_time_, *snapshot, query);
      }();
      if (result.has_error()) {
        log_sink_(TimeInterpreterLog{
            .reason = std::nullopt,
            .start_time = start_time_,
            .error = result.error(),
        });
      }
      return std::invoke(handle_result_, std::move(result));
    }

    StartTime blockchainStartTime() const {
      return start_time_;
    }

    const EraInterpreterAccessor &interpreter() const {
      return interpreter_;
    }

    const TimeInterpreterLogSink &logSink() const {
      return log_sink_;
    }

    const Handler &resultHandler() const {
      return handle_result_;
    }

   private:
    EraInterpreterAccessor interpreter_;
    StartTime start_time_;
    TimeInterpreterLogSink log_sink_;
    Handler handle_result_;
  };

  /**
   * Interpreter for callers which know that queries cannot fail, e.g.
   * because the chain never forks. A failure is still logged, with
   * {@param reason} and error severity, and then thrown as
   * PastHorizonException.
   */
  TimeInterpreter<RaiseOnFailure> neverFails(
      std::string reason, const TimeInterpreter<PropagateFailure> &ti);

  /**
   * Changes what query results become for the caller. {@param transform}
   * must accept the output of the current handler for any result type.
   * Start time, accessor and log sink are kept.
   */
  template <typename Transform, typename Handler>
  TimeInterpreter<HoistedHandler<Handler, Transform>> hoistTimeInterpreter(
      Transform transform, const TimeInterpreter<Handler> &ti) {
    return TimeInterpreter<HoistedHandler<Handler, Transform>>{
        ti.interpreter(),
        ti.blockchainStartTime(),
        ti.logSink(),
        HoistedHandler<Handler, Transform>{
            .handler = ti.resultHandler(),
            .transform = std::move(transform),
        },
    };
  }

  /**
   * Current wall-clock time relative to the chain start. Before the start
   * (freshly launched test networks) this is RelativeTime{0}.
   */
  template <typename Handler>
  RelativeTime currentRelativeTime(const clock::SystemClock &clock,
                                   const TimeInterpreter<Handler> &ti) {
    return toRelativeTimeOrZero(ti.blockchainStartTime(), clock.now());
  }

  /**
   * Interpreter over a chain which never changed its time-keeping rules
   */
  outcome::result<TimeInterpreter<>> mkTimeInterpreter(
      TimeInterpreterLogSink log_sink,
      StartTime start_time,
      EpochSize epoch_size,
      SlotLength slot_length);

  /**
   * Interpreter following the era history kept in {@param holder}
   */
  TimeInterpreter<> mkTimeInterpreter(
      TimeInterpreterLogSink log_sink,
      StartTime start_time,
      std::shared_ptr<const EraInterpreterHolder> holder);

}  // namespace tipsync::time

template <>
struct fmt::formatter<tipsync::time::TimeInterpreterLog> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const tipsync::time::TimeInterpreterLog &log,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    auto out = ctx.out();
    if (log.reason) {
      out = fmt::format_to(out, "[{}] ", *log.reason);
    }
    return fmt::format_to(out,
                          "time query failed (start time {}): {}",
                          log.start_time,
                          log.error.message());
  }
};
