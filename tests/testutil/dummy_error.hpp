/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace testutil {
  /**
   * Error for mocks and callbacks of tests, so that no real error category
   * of the library has to be borrowed.
   */
  enum class DummyError { ERROR = 1, ERROR_2 };
  Q_ENUM_ERROR_CODE(DummyError) {
    using E = decltype(e);
    switch (e) {
      case E::ERROR:
        return "dummy error";
      case E::ERROR_2:
        return "dummy error #2";
    }
    return "unknown (DummyError) error";
  }
}  // namespace testutil
