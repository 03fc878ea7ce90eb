/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sync/percentage.hpp"

namespace tipsync::sync {

  outcome::result<Percentage> Percentage::create(Ratio ratio) {
    if (ratio < 0 or ratio > 1) {
      return PercentageError::OUT_OF_BOUNDS;
    }
    return Percentage{ratio};
  }

}  // namespace tipsync::sync
