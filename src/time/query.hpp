/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

#include <qtils/outcome.hpp>

#include "time/era_interpreter.hpp"
#include "time/relative_time.hpp"

namespace tipsync::time {

  template <typename T>
  class Query;

  /**
   * Evaluates queries against one snapshot of the era history.
   *
   * Era-local leaves are delegated to the era interpreter, everything else
   * is evaluated here, so a composition of leaves may span several eras
   * even though each leaf is answered by a single era. The first failing
   * leaf aborts the whole query.
   */
  class QueryRunner {
   public:
    QueryRunner(StartTime start_time, const EraInterpreter &era_interpreter)
        : start_time_(start_time), era_interpreter_(era_interpreter) {}

    template <typename T>
    outcome::result<T> run(const Query<T> &query) const;

   private:
    StartTime start_time_;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    const EraInterpreter &era_interpreter_;
  };

  namespace detail {
    template <typename T>
    class BindStep {
     public:
      virtual ~BindStep() = default;
      virtual outcome::result<T> runWith(const QueryRunner &runner) const = 0;
    };

    template <typename A, typename T, typename F>
    class BindStepImpl final : public BindStep<T> {
     public:
      BindStepImpl(Query<A> query, F continuation)
          : query_(std::move(query)), continuation_(std::move(continuation)) {}

      outcome::result<T> runWith(const QueryRunner &runner) const override {
        BOOST_OUTCOME_TRY(auto value, runner.run(query_));
        return runner.run(std::invoke(continuation_, std::move(value)));
      }

     private:
      Query<A> query_;
      F continuation_;
    };

    template <typename Q>
    struct QueryValue;

    template <typename T>
    struct QueryValue<Query<T>> {
      using type = T;
    };
  }  // namespace detail

  /// Leaf yielding the chain start time
  struct QueryStartTime {};

  /**
   * Description of a slot/time conversion. Queries are immutable and can be
   * evaluated any number of times; nodes are shared between copies.
   */
  template <typename T>
  class Query {
   public:
    using ValueType = T;

    /// Query answerable by the rules of one era
    struct EraLocal {
      EraQuery<T> query;
    };

    struct Pure {
      T value;
    };

    /// Query whose result builds the next query
    struct Bind {
      std::shared_ptr<const detail::BindStep<T>> step;
    };

    using Node =
        std::conditional_t<std::is_same_v<T, StartTime>,
                           std::variant<EraLocal, Pure, Bind, QueryStartTime>,
                           std::variant<EraLocal, Pure, Bind>>;

    static Query eraLocal(EraQuery<T> query) {
      return Query{EraLocal{std::move(query)}};
    }

    static Query pure(T value) {
      return Query{Pure{std::move(value)}};
    }

    /**
     * Sequences this query with {@param continuation}, a callable taking the
     * result of this query and returning the next query to run.
     */
    template <typename F>
    auto bind(F continuation) const {
      using Next = std::remove_cvref_t<std::invoke_result_t<const F &, T>>;
      using U = typename detail::QueryValue<Next>::type;
      return Query<U>{typename Query<U>::Bind{
          std::make_shared<const detail::BindStepImpl<T, U, F>>(
              *this, std::move(continuation)),
      }};
    }

    template <typename F>
    auto map(F f) const {
      using U = std::remove_cvref_t<std::invoke_result_t<const F &, T>>;
      return bind([f = std::move(f)](T value) {
        return Query<U>::pure(std::invoke(f, std::move(value)));
      });
    }

    const Node &node() const {
      return node_;
    }

   private:
    template <typename>
    friend class Query;
    friend Query<StartTime> queryStartTime();

    explicit Query(Node node) : node_(std::move(node)) {}

    Node node_;
  };

  /// Query yielding the chain start time
  Query<StartTime> queryStartTime();

  template <typename T>
  outcome::result<T> QueryRunner::run(const Query<T> &query) const {
    using Q = Query<T>;
    return std::visit(
        [&]<typename N>(const N &node) -> outcome::result<T> {
          if constexpr (std::is_same_v<N, typename Q::EraLocal>) {
            return era_interpreter_.interpretQuery(node.query);
          } else if constexpr (std::is_same_v<N, typename Q::Pure>) {
            return node.value;
          } else if constexpr (std::is_same_v<N, typename Q::Bind>) {
            return node.step->runWith(*this);
          } else {
            static_assert(std::is_same_v<N, QueryStartTime>);
            return start_time_;
          }
        },
        query.node());
  }

  template <typename T>
  outcome::result<T> runQuery(StartTime start_time,
                              const EraInterpreter &era_interpreter,
                              const Query<T> &query) {
    return QueryRunner{start_time, era_interpreter}.run(query);
  }

  /// Relative time at which the slot starts
  Query<RelativeTime> slotToRelativeTime(Slot slot);

  /// Absolute time at which the slot starts
  Query<TimePoint> slotToWallclock(Slot slot);

  Query<Epoch> slotToEpoch(Slot slot);

  /// Slot which is ongoing at the given time
  Query<Slot> ongoingSlotAt(RelativeTime time);

}  // namespace tipsync::time
