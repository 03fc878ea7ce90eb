/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <compare>
#include <cstdint>

#include <boost/rational.hpp>
#include <fmt/format.h>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace tipsync::sync {
  using Ratio = boost::rational<int64_t>;

  enum class PercentageError : uint8_t {
    OUT_OF_BOUNDS = 1,
  };
  Q_ENUM_ERROR_CODE(PercentageError) {
    using E = decltype(e);
    switch (e) {
      case E::OUT_OF_BOUNDS:
        return "Percentage must be within [0, 1]";
    }
    return "Unknown PercentageError";
  }

  /**
   * Exact ratio within [0, 1]
   */
  class Percentage {
   public:
    static outcome::result<Percentage> create(Ratio ratio);

    const Ratio &value() const {
      return ratio_;
    }

    double toDouble() const {
      return boost::rational_cast<double>(ratio_);
    }

    bool operator==(const Percentage &other) const = default;

    std::strong_ordering operator<=>(const Percentage &other) const {
      if (ratio_ < other.ratio_) {
        return std::strong_ordering::less;
      }
      if (ratio_ == other.ratio_) {
        return std::strong_ordering::equal;
      }
      return std::strong_ordering::greater;
    }

   private:
    explicit Percentage(Ratio ratio) : ratio_(ratio) {}

    Ratio ratio_;
  };

}  // namespace tipsync::sync

template <>
struct fmt::formatter<tipsync::sync::Percentage> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const tipsync::sync::Percentage &percentage,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{:.2f}%", percentage.toDouble() * 100);
  }
};
